#include "voice_gateway/audio/codec.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace voice_gateway::audio {

namespace {

constexpr int kUlawBias = 0x84;
constexpr int kSegmentEnds[8] = {0xFF, 0x1FF, 0x3FF, 0x7FF, 0xFFF, 0x1FFF, 0x3FFF, 0x7FFF};

}

uint8_t linear_to_ulaw(int16_t sample) {
    int value = sample;
    int mask = 0xFF;
    if (value < 0) {
        value = kUlawBias - value;
        mask = 0x7F;
    } else {
        value += kUlawBias;
    }

    int segment = 0;
    while (segment < 8 && value > kSegmentEnds[segment]) {
        ++segment;
    }
    if (segment >= 8) {
        return static_cast<uint8_t>(0x7F ^ mask);
    }
    const int ulaw = (segment << 4) | ((value >> (segment + 3)) & 0x0F);
    return static_cast<uint8_t>(ulaw ^ mask);
}

int16_t ulaw_to_linear(uint8_t value) {
    const int ulaw = static_cast<uint8_t>(~value);
    int magnitude = ((ulaw & 0x0F) << 3) + kUlawBias;
    magnitude <<= (ulaw & 0x70) >> 4;
    return static_cast<int16_t>((ulaw & 0x80) ? (kUlawBias - magnitude)
                                              : (magnitude - kUlawBias));
}

std::vector<int16_t> decode_ulaw(const std::string& payload) {
    std::vector<int16_t> samples;
    samples.reserve(payload.size());
    for (char byte : payload) {
        samples.push_back(ulaw_to_linear(static_cast<uint8_t>(byte)));
    }
    return samples;
}

std::string encode_ulaw(const std::vector<int16_t>& samples) {
    std::string payload;
    payload.reserve(samples.size());
    for (auto sample : samples) {
        payload.push_back(static_cast<char>(linear_to_ulaw(sample)));
    }
    return payload;
}

std::vector<float> to_float(const std::vector<int16_t>& samples) {
    std::vector<float> audio;
    audio.reserve(samples.size());
    for (auto sample : samples) {
        audio.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return audio;
}

double rms(const std::vector<int16_t>& samples) {
    if (samples.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (auto sample : samples) {
        const double value = static_cast<double>(sample);
        sum += value * value;
    }
    return std::sqrt(sum / static_cast<double>(samples.size()));
}

Resampler::Resampler(int from_rate, int to_rate)
    : from_rate_(from_rate),
      to_rate_(to_rate) {
    if (from_rate <= 0 || to_rate <= 0) {
        throw std::invalid_argument("Resampler rates must be positive");
    }
    step_ = static_cast<double>(from_rate) / static_cast<double>(to_rate);
}

std::vector<int16_t> Resampler::process(const std::vector<int16_t>& input) {
    if (from_rate_ == to_rate_ || input.empty()) {
        return input;
    }

    // position_ indexes the virtual stream [previous_, input...]; -1 refers to previous_.
    const auto count = static_cast<int64_t>(input.size());
    std::vector<int16_t> output;
    output.reserve(static_cast<size_t>(static_cast<double>(count) / step_) + 2);
    while (true) {
        const double base = std::floor(position_);
        const auto left = static_cast<int64_t>(base);
        const auto right = left + 1;
        if (right >= count) {
            break;
        }
        const double fraction = position_ - base;
        const double s0 = left < 0 ? (has_previous_ ? previous_ : input.front())
                                   : input[static_cast<size_t>(left)];
        const double s1 = input[static_cast<size_t>(right)];
        const double value = s0 + (s1 - s0) * fraction;
        output.push_back(static_cast<int16_t>(
            std::clamp(std::lround(value), -32768L, 32767L)));
        position_ += step_;
    }
    position_ -= static_cast<double>(count);
    previous_ = input.back();
    has_previous_ = true;
    return output;
}

void Resampler::reset() {
    position_ = 0.0;
    previous_ = 0;
    has_previous_ = false;
}

}
