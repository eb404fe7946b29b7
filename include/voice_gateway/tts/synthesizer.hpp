#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace voice_gateway {
namespace tts {

class Synthesizer {
public:
    // Receives PCM as it is produced. Returning false stops synthesis.
    using ChunkHandler = std::function<bool(const std::vector<int16_t>& samples)>;

    virtual ~Synthesizer() = default;

    virtual int sample_rate() const = 0;

    // Returns false when the handler stopped the stream. Throws SynthesisError.
    virtual bool synthesize(const std::string& text, const ChunkHandler& handler) = 0;
};

// OpenAI-compatible speech endpoint streaming raw s16le PCM (Kokoro-FastAPI).
class HttpSynthesizer : public Synthesizer {
public:
    HttpSynthesizer(std::string base_url,
                    std::string model,
                    std::string voice,
                    int sample_rate,
                    std::chrono::seconds timeout);

    int sample_rate() const override { return sample_rate_; }
    bool synthesize(const std::string& text, const ChunkHandler& handler) override;

private:
    std::string base_url_;
    std::string model_;
    std::string voice_;
    int sample_rate_;
    std::chrono::seconds timeout_;
};

}
}
