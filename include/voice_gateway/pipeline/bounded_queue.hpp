#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace voice_gateway {
namespace pipeline {

enum class PushResult {
    Accepted,
    DroppedOldest,
    Closed
};

// Multi-producer, multi-consumer FIFO with a fixed capacity. Consumers drain the
// remaining items after close() before pop() reports end of stream.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while the queue is full. Returns false once the queue is closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Never blocks; evicts the oldest item when full.
    PushResult try_push(T item) {
        PushResult result = PushResult::Accepted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return PushResult::Closed;
            }
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                result = PushResult::DroppedOldest;
            }
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return result;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return take(lock);
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return take(lock);
    }

    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return take(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    size_t clear() {
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            removed = items_.size();
            items_.clear();
        }
        not_full_.notify_all();
        return removed;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

}
}
