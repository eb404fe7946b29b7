#include "voice_gateway/sip/pj_thread.hpp"

#include <pj/os.h>

#include "voice_gateway/utils/async.hpp"

namespace voice_gateway::sip {

void ensure_pj_thread_registered(const char* name) {
    if (pj_thread_is_registered()) {
        return;
    }
    thread_local pj_thread_desc desc;
    pj_thread_t* thread = nullptr;
    pj_thread_register(name ? name : "voicegw", desc, &thread);
}

void install_async_thread_hook() {
    utils::set_async_thread_hook([]() { ensure_pj_thread_registered("voicegw_async"); });
}

}
