#include "voice_gateway/vad/energy_detector.hpp"

#include <algorithm>
#include <vector>

#include "voice_gateway/audio/codec.hpp"

namespace voice_gateway::vad {

namespace {

constexpr size_t kNoiseHistory = 100;
constexpr size_t kMinNoiseSamples = 10;
constexpr double kNoiseMultiplier = 1.5;
constexpr double kAdaptiveCeiling = 2000.0;

}

EnergyDetector::EnergyDetector(double base_threshold, int sampling_rate, int window_ms)
    : base_threshold_(base_threshold),
      sampling_rate_(sampling_rate),
      window_samples_(static_cast<size_t>(sampling_rate) * static_cast<size_t>(window_ms) / 1000) {}

float EnergyDetector::speech_probability(const std::vector<int16_t>& window) {
    const double level = audio::rms(window);
    const bool speech = level > current_threshold();
    if (!speech) {
        noise_history_.push_back(level);
        if (noise_history_.size() > kNoiseHistory) {
            noise_history_.pop_front();
        }
    }
    return speech ? 1.0f : 0.0f;
}

void EnergyDetector::reset() {
    noise_history_.clear();
}

double EnergyDetector::current_threshold() const {
    if (noise_history_.size() < kMinNoiseSamples) {
        return base_threshold_;
    }
    std::vector<double> sorted(noise_history_.begin(), noise_history_.end());
    std::sort(sorted.begin(), sorted.end());
    const double p85 = sorted[sorted.size() * 85 / 100];
    const double adaptive = std::min(p85 * kNoiseMultiplier, std::max(kAdaptiveCeiling, base_threshold_));
    return std::max(base_threshold_, adaptive);
}

}
