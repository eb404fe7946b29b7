#include "voice_gateway/sip/app.hpp"

#include <chrono>
#include <thread>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/sip/account.hpp"
#include "voice_gateway/sip/call.hpp"

namespace voice_gateway::sip {

namespace {

constexpr int kEventsTimeoutMs = 10;
constexpr auto kIdleDelay = std::chrono::milliseconds(10);
constexpr auto kMaxIdleDelay = std::chrono::milliseconds(100);

}

SipApp::SipApp(const Config& config, session::SessionManager& sessions)
    : config_(config), sessions_(sessions) {}

SipApp::~SipApp() {
    stop();
    shutdown();
}

void SipApp::shutdown() {
    shutdown_pjsip();
}

void SipApp::init() {
    try {
        init_pjsip();
    } catch (const pj::Error& err) {
        shutdown_pjsip();
        throw TransportError("PJSIP init failed: " + err.reason);
    }
    logging::info("SIP endpoint started",
                  {kv("port", config_.sip_port),
                   kv("user", config_.sip_user),
                   kv("domain", config_.sip_domain)});
}

void SipApp::run() {
    int consecutive_empty_cycles = 0;
    while (!quitting_) {
        const auto processed = handle_events();
        if (processed == 0) {
            ++consecutive_empty_cycles;
            std::this_thread::sleep_for(consecutive_empty_cycles > 10 ? kMaxIdleDelay : kIdleDelay);
        } else {
            consecutive_empty_cycles = 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void SipApp::stop() {
    quitting_ = true;
}

bool SipApp::has_capacity() const {
    return static_cast<int>(sessions_.active_count()) < config_.max_sessions;
}

int SipApp::handle_events() {
    if (!endpoint_) {
        return 0;
    }
    try {
        return endpoint_->libHandleEvents(kEventsTimeoutMs);
    } catch (const pj::Error& err) {
        logging::error("PJSIP handle events error", {kv("reason", err.reason), kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error("PJSIP handle events exception", {kv("error", ex.what())});
    }
    return 0;
}

void SipApp::register_call(const std::shared_ptr<SipCall>& call) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    const auto call_id = call->getId();
    if (call_id != PJSUA_INVALID_ID) {
        calls_[call_id] = call;
    }
}

void SipApp::unregister_call(int call_id) {
    std::shared_ptr<SipCall> call;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = calls_.find(call_id);
        if (it == calls_.end()) {
            return;
        }
        call = std::move(it->second);
        calls_.erase(it);
    }
    // Released outside the lock; pj::Call may call back into us while destructing.
    call.reset();
}

void SipApp::handle_call_disconnected(int call_id) {
    logging::info("SIP call disconnected", {kv("call_id", call_id)});
    unregister_call(call_id);
}

void SipApp::start_session(int call_id, const std::shared_ptr<SipMediaTransport>& transport) {
    try {
        const auto session_id = sessions_.start_session(transport);
        logging::info("SIP session started", {kv("call_id", call_id), kv("session_id", session_id)});
    } catch (const SessionLimitError& ex) {
        logging::warn("SIP session rejected", {kv("call_id", call_id), kv("reason", ex.what())});
        Metrics::instance().increment("session_rejected");
        transport->hangup();
    } catch (const std::exception& ex) {
        logging::error("SIP session failed to start", {kv("call_id", call_id), kv("error", ex.what())});
        transport->hangup();
    }
}

void SipApp::init_pjsip() {
    endpoint_ = std::make_unique<pj::Endpoint>();
    endpoint_->libCreate();

    pj::EpConfig ep_cfg;
    // Events are polled from run().
    ep_cfg.uaConfig.threadCnt = 0;
    ep_cfg.uaConfig.mainThreadOnly = false;
    ep_cfg.uaConfig.maxCalls = static_cast<unsigned>(config_.max_sessions);
    ep_cfg.medConfig.threadCnt = 1;
    ep_cfg.medConfig.hasIoqueue = true;
    ep_cfg.medConfig.noVad = true;
    ep_cfg.medConfig.sndAutoCloseTime = -1;
    ep_cfg.logConfig.level = static_cast<unsigned>(config_.pjsip_log_level);
    if (config_.log_filename) {
        ep_cfg.logConfig.filename = *config_.log_filename;
    }
    endpoint_->libInit(ep_cfg);

    for (const auto& codec : endpoint_->codecEnum2()) {
        logging::debug("Supported codec", {kv("codec_id", codec.codecId), kv("priority", codec.priority)});
    }
    if (config_.sip_null_device) {
        endpoint_->audDevManager().setNullDev();
    }
    pj::TransportConfig sip_tp_config;
    sip_tp_config.port = static_cast<unsigned>(config_.sip_port);
    endpoint_->transportCreate(PJSIP_TRANSPORT_UDP, sip_tp_config);
    if (config_.sip_use_tcp) {
        endpoint_->transportCreate(PJSIP_TRANSPORT_TCP, sip_tp_config);
    }
    endpoint_->libStart();

    pj::AccountConfig account_cfg;
    account_cfg.idUri = "sip:" + config_.sip_user + "@" + config_.sip_domain;
    account_cfg.regConfig.registrarUri =
        "sip:" + config_.sip_domain + (config_.sip_use_tcp ? ";transport=tcp" : "");
    const auto login = config_.sip_login.empty() ? config_.sip_user : config_.sip_login;
    pj::AuthCredInfo cred("digest", "*", login, 0, config_.sip_password);
    account_cfg.sipConfig.authCreds.push_back(cred);

    account_ = std::make_unique<SipAccount>(*this);
    account_->create(account_cfg);
}

void SipApp::shutdown_pjsip() {
    if (shut_down_.exchange(true) || !endpoint_) {
        return;
    }
    std::unordered_map<int, std::shared_ptr<SipCall>> calls;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        calls.swap(calls_);
    }
    try {
        endpoint_->hangupAllCalls();
    } catch (const pj::Error& err) {
        logging::warn("Hangup of remaining calls failed", {kv("reason", err.reason)});
    }
    calls.clear();
    try {
        if (account_) {
            account_->shutdown();
            account_.reset();
        }
        endpoint_->libDestroy();
    } catch (const pj::Error& err) {
        logging::error("PJSIP shutdown failed", {kv("reason", err.reason), kv("status", err.status)});
    }
    endpoint_.reset();
    logging::info("SIP endpoint stopped");
}

}
