#include "voice_gateway/sip/account.hpp"

#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/sip/app.hpp"
#include "voice_gateway/sip/call.hpp"

namespace voice_gateway::sip {

namespace {

const char* registration_label(int status_code) {
    if (status_code == 200) {
        return "ok";
    }
    if (status_code == 408) {
        return "timeout";
    }
    if (status_code / 100 == 5) {
        return "server_error";
    }
    return "failed";
}

void reject(SipCall& call, int status_code, int call_id) {
    try {
        call.hangup(status_code);
    } catch (const pj::Error& err) {
        logging::warn("Rejecting call failed", {kv("call_id", call_id), kv("reason", err.reason)});
    }
}

}

SipAccount::SipAccount(SipApp& app) : app_(app) {}

void SipAccount::onRegState(pj::OnRegStateParam& prm) {
    const int status_code = static_cast<int>(prm.code);
    if (status_code == 0) {
        return;
    }
    const auto* label = registration_label(status_code);
    Metrics::instance().increment("sip_registration", label);
    if (status_code != 200) {
        logging::warn("SIP registration not accepted",
                      {kv("status", status_code), kv("result", label), kv("reason", prm.reason)});
        return;
    }
    logging::info("SIP registered", {kv("user", app_.config().sip_user), kv("domain", app_.config().sip_domain)});
    try {
        pj::PresenceStatus presence;
        presence.status = PJSUA_BUDDY_STATUS_ONLINE;
        presence.note = "Ready to answer";
        setOnlineStatus(presence);
    } catch (const pj::Error& err) {
        logging::warn("Setting SIP presence failed", {kv("reason", err.reason), kv("status", err.status)});
    }
}

void SipAccount::onIncomingCall(pj::OnIncomingCallParam& iprm) {
    const int call_id = iprm.callId;
    auto call = std::make_shared<SipCall>(app_, *this, call_id);
    if (!app_.has_capacity()) {
        logging::warn("SIP call refused, session limit reached", {kv("call_id", call_id)});
        Metrics::instance().increment("session_rejected");
        reject(*call, PJSIP_SC_BUSY_HERE, call_id);
        return;
    }
    try {
        const auto info = call->getInfo();
        logging::info("Incoming SIP call", {kv("call_id", call_id), kv("from", info.remoteUri)});
        call->set_remote_uri(info.remoteUri);
        app_.register_call(call);
        call->answer(PJSIP_SC_RINGING);
        call->answer(PJSIP_SC_OK);
    } catch (const pj::Error& err) {
        logging::error("Answering SIP call failed", {kv("call_id", call_id), kv("reason", err.reason)});
        reject(*call, PJSIP_SC_INTERNAL_SERVER_ERROR, call_id);
        app_.unregister_call(call_id);
    }
}

}
