#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "voice_gateway/utils/async.hpp"

namespace voice_gateway {
namespace pipeline {

class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& message) : std::runtime_error(message) {}
};

class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& message) : std::runtime_error(message) {}
};

// Copyable handle to a shared cancellation flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    void throw_if_cancelled(const std::string& what) const {
        if (cancelled()) {
            throw OperationCancelled(what + " cancelled");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Runs task on its own thread and waits for it until timeout or cancellation.
// On timeout or cancel the caller stops waiting and the token handed to the task
// is cancelled. The task keeps running detached until it notices, so it must hold
// its own references to whatever it uses.
template <typename R>
R run_with_deadline(std::function<R(const CancelToken&)> task,
                    std::chrono::milliseconds timeout,
                    const CancelToken& token,
                    const std::string& what) {
    CancelToken attempt;
    auto packaged = std::make_shared<std::packaged_task<R()>>(
        [task = std::move(task), attempt]() { return task(attempt); });
    auto future = packaged->get_future();
    utils::run_async([packaged]() { (*packaged)(); });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto poll = std::chrono::milliseconds(20);
    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                return future.get();
            }
            attempt.cancel();
            throw DeadlineExceeded(what + " timed out");
        }
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (future.wait_for(std::min(poll, remaining)) == std::future_status::ready) {
            return future.get();
        }
        if (token.cancelled()) {
            attempt.cancel();
            throw OperationCancelled(what + " cancelled");
        }
    }
}

}
}
