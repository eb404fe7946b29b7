#pragma once

#include <cstdint>
#include <vector>

namespace voice_gateway {
namespace audio {

enum class Direction {
    Inbound,
    Outbound
};

struct AudioFrame {
    uint64_t sequence = 0;
    Direction direction = Direction::Inbound;
    int sample_rate = 16000;
    std::vector<int16_t> samples;

    double duration_sec() const {
        if (sample_rate <= 0) {
            return 0.0;
        }
        return static_cast<double>(samples.size()) / static_cast<double>(sample_rate);
    }
};

inline size_t samples_per_frame(int sample_rate, int frame_ms) {
    return static_cast<size_t>(sample_rate) * static_cast<size_t>(frame_ms) / 1000;
}

}
}
