#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace voice_gateway {
namespace stt {

struct RecognitionResult {
    std::string text;
    float confidence = 1.0f;
};

class Recognizer {
public:
    virtual ~Recognizer() = default;

    // Throws RecognitionError when the engine fails.
    virtual RecognitionResult transcribe(const std::vector<int16_t>& samples, int sample_rate) = 0;
};

// whisper.cpp server: POST /inference with a WAV file.
class HttpRecognizer : public Recognizer {
public:
    HttpRecognizer(std::string base_url, std::string language, std::chrono::seconds timeout);

    RecognitionResult transcribe(const std::vector<int16_t>& samples, int sample_rate) override;

private:
    std::string base_url_;
    std::string language_;
    std::chrono::seconds timeout_;
};

}
}
