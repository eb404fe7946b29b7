#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voice_gateway {
namespace vad {

// Frame-level speech classifier. Not thread-safe; one instance per stream.
class SpeechDetector {
public:
    virtual ~SpeechDetector() = default;

    // window holds exactly window_samples() samples at sampling_rate().
    virtual float speech_probability(const std::vector<int16_t>& window) = 0;
    virtual void reset() = 0;

    virtual size_t window_samples() const = 0;
    virtual int sampling_rate() const = 0;
};

}
}
