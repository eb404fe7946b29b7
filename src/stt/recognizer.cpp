#include "voice_gateway/stt/recognizer.hpp"

#include <cmath>
#include <utility>

#include "voice_gateway/audio/wav.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/http/client.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway::stt {

namespace {

float confidence_from(const nlohmann::json& response) {
    if (response.contains("confidence") && response["confidence"].is_number()) {
        return response["confidence"].get<float>();
    }
    const auto segments = response.find("segments");
    if (segments == response.end() || !segments->is_array() || segments->empty()) {
        return 1.0f;
    }
    double total = 0.0;
    size_t count = 0;
    for (const auto& segment : *segments) {
        if (segment.contains("avg_logprob") && segment["avg_logprob"].is_number()) {
            total += std::exp(segment["avg_logprob"].get<double>());
            ++count;
        }
    }
    return count == 0 ? 1.0f : static_cast<float>(total / static_cast<double>(count));
}

}

HttpRecognizer::HttpRecognizer(std::string base_url, std::string language, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      language_(std::move(language)),
      timeout_(timeout) {}

RecognitionResult HttpRecognizer::transcribe(const std::vector<int16_t>& samples, int sample_rate) {
    HttpRequestOptions options;
    options.connect_timeout = std::chrono::seconds(5);
    options.read_timeout = timeout_;
    options.request_timeout = timeout_;

    httplib::MultipartFormDataItems items = {
        {"file", audio::encode_wav(samples, sample_rate), "audio.wav", "audio/wav"},
        {"response_format", "json", "", ""},
        {"temperature", "0.0", "", ""},
    };
    if (!language_.empty()) {
        items.push_back({"language", language_, "", ""});
    }

    nlohmann::json response;
    try {
        HttpClient client(base_url_, options);
        response = client.post_multipart("/inference", items);
    } catch (const HttpError& ex) {
        throw RecognitionError(std::string("Speech recognition failed: ") + ex.what());
    }
    if (!response.contains("text") || !response["text"].is_string()) {
        throw RecognitionError("Speech recognition response has no text");
    }
    RecognitionResult result;
    result.text = utils::trim(response["text"].get<std::string>());
    result.confidence = confidence_from(response);
    return result;
}

}
