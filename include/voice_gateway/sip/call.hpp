#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <pjsua2.hpp>

#include "voice_gateway/sip/media_port.hpp"

namespace voice_gateway {
namespace sip {

class SipApp;

class SipCall : public pj::Call, public std::enable_shared_from_this<SipCall> {
public:
    SipCall(SipApp& app, pj::Account& account, int call_id = PJSUA_INVALID_ID);
    ~SipCall() override;

    void answer(int status_code);
    void hangup(int status_code);
    void transfer_to(const std::string& target);

    void set_remote_uri(std::string uri) { remote_uri_ = std::move(uri); }

    void onCallState(pj::OnCallStateParam& prm) override;
    void onCallMediaState(pj::OnCallMediaStateParam& prm) override;
    void onCallTransferStatus(pj::OnCallTransferStatusParam& prm) override;

private:
    void open_media();
    void close_media();
    transport::TransportInfo make_info();

    SipApp& app_;
    std::string remote_uri_;
    std::atomic<bool> media_active_{false};
    std::unique_ptr<pj::AudioMedia> audio_media_;
    std::unique_ptr<CallMediaPort> media_port_;
    std::shared_ptr<SipMediaTransport> transport_;
    std::mutex media_mutex_;
};

// User part of a SIP URI: "\"Bob\" <sip:+1555@host>" -> "+1555".
std::string phone_from_uri(const std::string& uri);

}
}
