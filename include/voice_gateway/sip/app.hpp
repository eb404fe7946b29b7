#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <pjsua2.hpp>

#include "voice_gateway/config.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/sip/media_port.hpp"

namespace voice_gateway {
namespace sip {

class SipAccount;
class SipCall;

// pjsua2 user agent that answers inbound calls and hands each call's audio to a
// session as a SipMediaTransport.
class SipApp {
public:
    SipApp(const Config& config, session::SessionManager& sessions);
    ~SipApp();

    void init();
    // Polls pjsip events until stop().
    void run();
    void stop();
    // Hangs up remaining calls and destroys the endpoint. Call after run() returned.
    void shutdown();

    const Config& config() const { return config_; }
    bool has_capacity() const;

private:
    friend class SipAccount;
    friend class SipCall;

    int handle_events();
    void init_pjsip();
    void shutdown_pjsip();
    void register_call(const std::shared_ptr<SipCall>& call);
    void unregister_call(int call_id);
    void handle_call_disconnected(int call_id);
    void start_session(int call_id, const std::shared_ptr<SipMediaTransport>& transport);

    const Config& config_;
    session::SessionManager& sessions_;
    std::unique_ptr<pj::Endpoint> endpoint_;
    std::unique_ptr<SipAccount> account_;
    std::unordered_map<int, std::shared_ptr<SipCall>> calls_;
    std::mutex calls_mutex_;
    std::atomic<bool> quitting_{false};
    std::atomic<bool> shut_down_{false};
};

}
}
