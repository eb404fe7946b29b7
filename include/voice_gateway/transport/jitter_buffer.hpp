#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "voice_gateway/audio/frame.hpp"

namespace voice_gateway {
namespace transport {

// Reorders inbound frames by sequence number. Frames are held until they are next
// in line or until more than `depth` frames are waiting, at which point the
// missing ones are replaced by silence (at most max_gap_fill per gap).
class JitterBuffer {
public:
    JitterBuffer(size_t depth, size_t max_gap_fill, size_t frame_samples, int sample_rate);

    // Returns the frames that became ready, in sequence order.
    std::vector<audio::AudioFrame> push(audio::AudioFrame frame);
    std::vector<audio::AudioFrame> flush();

    uint64_t late_frames() const { return late_frames_; }
    uint64_t filled_frames() const { return filled_frames_; }
    uint64_t skipped_frames() const { return skipped_frames_; }

private:
    void release_ready(std::vector<audio::AudioFrame>& out);
    void fill_gap(std::vector<audio::AudioFrame>& out);
    audio::AudioFrame silence(uint64_t sequence) const;

    size_t depth_;
    size_t max_gap_fill_;
    size_t frame_samples_;
    int sample_rate_;
    std::optional<uint64_t> next_;
    std::map<uint64_t, audio::AudioFrame> pending_;
    uint64_t late_frames_ = 0;
    uint64_t filled_frames_ = 0;
    uint64_t skipped_frames_ = 0;
};

}
}
