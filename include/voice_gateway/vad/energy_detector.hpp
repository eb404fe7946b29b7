#pragma once

#include <deque>

#include "voice_gateway/vad/detector.hpp"

namespace voice_gateway {
namespace vad {

// RMS detector with an adaptive noise floor. The floor is learned from windows
// classified as non-speech, so a noisy line raises the threshold but speech never does.
class EnergyDetector : public SpeechDetector {
public:
    EnergyDetector(double base_threshold, int sampling_rate, int window_ms = 20);

    float speech_probability(const std::vector<int16_t>& window) override;
    void reset() override;

    size_t window_samples() const override { return window_samples_; }
    int sampling_rate() const override { return sampling_rate_; }

    double current_threshold() const;

private:
    double base_threshold_;
    int sampling_rate_;
    size_t window_samples_;
    std::deque<double> noise_history_;
};

}
}
