#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "voice_gateway/audio/frame.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"

namespace voice_gateway {
namespace transport {

// Send-side frame queue shared by the transports. push() never blocks; when the
// queue overflows the oldest frame is dropped and a degraded-audio episode starts.
// The episode ends once the queue drains below half its capacity.
class OutboundAudioQueue {
public:
    OutboundAudioQueue(size_t capacity, std::string connection_id);

    void push(audio::AudioFrame frame);
    std::optional<audio::AudioFrame> pop();
    std::optional<audio::AudioFrame> pop_for(std::chrono::milliseconds timeout);
    std::optional<audio::AudioFrame> try_pop();
    size_t clear();
    void close();

    bool degraded() const { return degraded_.load(); }
    size_t dropped() const { return queue_.dropped(); }
    size_t size() const { return queue_.size(); }

private:
    void note_drained();

    pipeline::BoundedQueue<audio::AudioFrame> queue_;
    std::string connection_id_;
    std::atomic<bool> degraded_{false};
};

}
}
