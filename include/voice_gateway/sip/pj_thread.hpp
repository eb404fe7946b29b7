#pragma once

namespace voice_gateway {
namespace sip {

// pjlib refuses calls from threads it does not know about.
void ensure_pj_thread_registered(const char* name);

// Registers every utils::run_async thread with pjlib.
void install_async_thread_hook();

}
}
