#include "voice_gateway/transport/outbound_queue.hpp"

#include <utility>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"

namespace voice_gateway::transport {

OutboundAudioQueue::OutboundAudioQueue(size_t capacity, std::string connection_id)
    : queue_(capacity), connection_id_(std::move(connection_id)) {}

void OutboundAudioQueue::push(audio::AudioFrame frame) {
    frame.direction = audio::Direction::Outbound;
    const auto result = queue_.try_push(std::move(frame));
    if (result != pipeline::PushResult::DroppedOldest) {
        return;
    }
    if (!degraded_.exchange(true)) {
        logging::warn("Outbound audio degraded, dropping oldest frames",
                      {kv("connection_id", connection_id_), kv("capacity", queue_.capacity())});
        Metrics::instance().increment("degraded_audio");
    }
}

std::optional<audio::AudioFrame> OutboundAudioQueue::pop() {
    auto frame = queue_.pop();
    note_drained();
    return frame;
}

std::optional<audio::AudioFrame> OutboundAudioQueue::pop_for(std::chrono::milliseconds timeout) {
    auto frame = queue_.pop_for(timeout);
    note_drained();
    return frame;
}

std::optional<audio::AudioFrame> OutboundAudioQueue::try_pop() {
    auto frame = queue_.try_pop();
    note_drained();
    return frame;
}

size_t OutboundAudioQueue::clear() {
    const auto removed = queue_.clear();
    note_drained();
    return removed;
}

void OutboundAudioQueue::close() {
    queue_.close();
}

void OutboundAudioQueue::note_drained() {
    if (!degraded_.load() || queue_.size() * 2 >= queue_.capacity()) {
        return;
    }
    if (degraded_.exchange(false)) {
        logging::info("Outbound audio recovered",
                      {kv("connection_id", connection_id_), kv("dropped_total", queue_.dropped())});
    }
}

}
