#include "voice_gateway/utils/async.hpp"

#include <mutex>
#include <thread>

#include "voice_gateway/logging.hpp"

namespace voice_gateway::utils {

namespace {

std::mutex hook_mutex;
std::function<void()> thread_hook;

std::function<void()> current_hook() {
    std::lock_guard<std::mutex> lock(hook_mutex);
    return thread_hook;
}

}

void set_async_thread_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hook_mutex);
    thread_hook = std::move(hook);
}

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task), hook = current_hook()]() mutable {
        if (hook) {
            hook();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Async task failed", {kv("error", ex.what())});
        }
    });
    worker.detach();
}

}
