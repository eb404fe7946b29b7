#pragma once

#include <functional>

namespace voice_gateway {
namespace utils {

// Runs the task on a detached thread. The task must own everything it touches.
void run_async(std::function<void()> task);

// Hook invoked at the start of every run_async thread, e.g. to register the thread
// with a C library that requires it.
void set_async_thread_hook(std::function<void()> hook);

}
}
