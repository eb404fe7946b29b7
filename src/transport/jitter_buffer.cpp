#include "voice_gateway/transport/jitter_buffer.hpp"

#include <algorithm>
#include <utility>

namespace voice_gateway::transport {

JitterBuffer::JitterBuffer(size_t depth, size_t max_gap_fill, size_t frame_samples, int sample_rate)
    : depth_(depth),
      max_gap_fill_(max_gap_fill),
      frame_samples_(frame_samples),
      sample_rate_(sample_rate) {}

std::vector<audio::AudioFrame> JitterBuffer::push(audio::AudioFrame frame) {
    std::vector<audio::AudioFrame> ready;
    if (!next_) {
        next_ = frame.sequence;
    }
    if (frame.sequence < *next_ || pending_.count(frame.sequence) > 0) {
        ++late_frames_;
        return ready;
    }
    const auto sequence = frame.sequence;
    pending_.emplace(sequence, std::move(frame));
    release_ready(ready);
    while (pending_.size() > depth_) {
        fill_gap(ready);
        release_ready(ready);
    }
    return ready;
}

std::vector<audio::AudioFrame> JitterBuffer::flush() {
    std::vector<audio::AudioFrame> ready;
    release_ready(ready);
    while (!pending_.empty()) {
        fill_gap(ready);
        release_ready(ready);
    }
    return ready;
}

void JitterBuffer::release_ready(std::vector<audio::AudioFrame>& out) {
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == *next_) {
        out.push_back(std::move(it->second));
        it = pending_.erase(it);
        ++*next_;
    }
}

void JitterBuffer::fill_gap(std::vector<audio::AudioFrame>& out) {
    if (pending_.empty()) {
        return;
    }
    const uint64_t target = pending_.begin()->first;
    const uint64_t missing = target - *next_;
    const uint64_t fill = std::min<uint64_t>(missing, max_gap_fill_);
    for (uint64_t i = 0; i < fill; ++i) {
        out.push_back(silence(*next_ + i));
    }
    filled_frames_ += fill;
    skipped_frames_ += missing - fill;
    next_ = target;
}

audio::AudioFrame JitterBuffer::silence(uint64_t sequence) const {
    audio::AudioFrame frame;
    frame.sequence = sequence;
    frame.direction = audio::Direction::Inbound;
    frame.sample_rate = sample_rate_;
    frame.samples.assign(frame_samples_, 0);
    return frame;
}

}
