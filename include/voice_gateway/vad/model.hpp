#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "voice_gateway/vad/detector.hpp"

namespace voice_gateway {
namespace vad {

// Silero VAD ONNX model. The session is shared by every call; recurrent state
// lives in SileroDetector.
class SileroModel {
public:
    SileroModel(const std::filesystem::path& model_path, int sampling_rate);
    ~SileroModel();

    int sampling_rate() const;
    size_t window_samples() const;
    std::vector<float> initialize_state() const;
    float get_speech_prob(const std::vector<float>& audio, std::vector<float>* state) const;

    // Downloads the model when it is missing, then loads it.
    static std::shared_ptr<SileroModel> load(const std::filesystem::path& model_path,
                                             const std::string& model_url,
                                             int sampling_rate);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class SileroDetector : public SpeechDetector {
public:
    explicit SileroDetector(std::shared_ptr<SileroModel> model);

    float speech_probability(const std::vector<int16_t>& window) override;
    void reset() override;

    size_t window_samples() const override;
    int sampling_rate() const override;

private:
    std::shared_ptr<SileroModel> model_;
    std::vector<float> state_;
};

}
}
