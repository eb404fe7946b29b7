#include "voice_gateway/tts/synthesizer.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/http/client.hpp"
#include "voice_gateway/logging.hpp"

namespace voice_gateway::tts {

HttpSynthesizer::HttpSynthesizer(std::string base_url,
                                 std::string model,
                                 std::string voice,
                                 int sample_rate,
                                 std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      model_(std::move(model)),
      voice_(std::move(voice)),
      sample_rate_(sample_rate),
      timeout_(timeout) {}

bool HttpSynthesizer::synthesize(const std::string& text, const ChunkHandler& handler) {
    HttpRequestOptions options;
    options.request_timeout = timeout_;
    options.read_timeout = timeout_;

    const nlohmann::json body = {
        {"model", model_},
        {"input", text},
        {"voice", voice_},
        {"response_format", "pcm"},
        {"stream", true},
    };

    // Chunks may split a sample across two reads.
    std::string carry;
    std::vector<int16_t> samples;
    size_t total_bytes = 0;
    const auto receiver = [&](const char* data, size_t size) {
        total_bytes += size;
        carry.append(data, size);
        const size_t usable = carry.size() - carry.size() % 2;
        if (usable == 0) {
            return true;
        }
        samples.resize(usable / 2);
        for (size_t i = 0; i < samples.size(); ++i) {
            const auto lo = static_cast<uint8_t>(carry[2 * i]);
            const auto hi = static_cast<uint8_t>(carry[2 * i + 1]);
            samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        }
        carry.erase(0, usable);
        return handler(samples);
    };

    try {
        HttpClient client(base_url_, options);
        const bool completed = client.post_json_streaming("/v1/audio/speech", body, receiver);
        if (completed && total_bytes == 0) {
            throw SynthesisError("TTS returned no audio");
        }
        logging::debug("TTS stream finished",
                       {kv("bytes", total_bytes), kv("completed", completed)});
        return completed;
    } catch (const HttpError& ex) {
        throw SynthesisError(std::string("TTS request failed: ") + ex.what());
    }
}

}
