#include "voice_gateway/sip/call.hpp"

#include "voice_gateway/logging.hpp"
#include "voice_gateway/sip/app.hpp"
#include "voice_gateway/utils/async.hpp"

namespace voice_gateway::sip {

std::string phone_from_uri(const std::string& uri) {
    auto start = uri.find("sip:");
    start = start == std::string::npos ? 0 : start + 4;
    const auto end = uri.find_first_of("@;>", start);
    const auto user = uri.substr(start, end == std::string::npos ? std::string::npos : end - start);
    return user;
}

SipCall::SipCall(SipApp& app, pj::Account& account, int call_id)
    : pj::Call(account, call_id), app_(app) {}

SipCall::~SipCall() {
    close_media();
}

void SipCall::answer(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::answer(prm);
}

void SipCall::hangup(int status_code) {
    pj::CallOpParam prm(true);
    prm.statusCode = static_cast<pjsip_status_code>(status_code);
    pj::Call::hangup(prm);
}

void SipCall::transfer_to(const std::string& target) {
    auto uri = target;
    if (uri.rfind("sip:", 0) != 0 && uri.rfind("tel:", 0) != 0) {
        uri = "sip:" + target + "@" + app_.config().sip_domain;
    }
    pj::CallOpParam prm(true);
    xfer(uri, prm);
}

transport::TransportInfo SipCall::make_info() {
    transport::TransportInfo info;
    const auto call_info = getInfo();
    info.call_id = call_info.callIdString;
    info.stream_id = "sip-" + std::to_string(getId());
    info.caller = phone_from_uri(remote_uri_.empty() ? call_info.remoteUri : remote_uri_);
    info.callee = phone_from_uri(call_info.localUri);
    return info;
}

void SipCall::onCallState(pj::OnCallStateParam& prm) {
    (void)prm;
    try {
        const auto info = getInfo();
        logging::debug(
            "Call state changed",
            {kv("call_id", info.callIdString),
             kv("uri", info.remoteUri),
             kv("state", static_cast<int>(info.state)),
             kv("state_text", info.stateText)});
        if (info.state == PJSIP_INV_STATE_CONFIRMED) {
            open_media();
        }
        if (info.state == PJSIP_INV_STATE_DISCONNECTED) {
            logging::info("Call disconnected",
                          {kv("call_id", info.callIdString),
                           kv("status", static_cast<int>(info.lastStatusCode)),
                           kv("reason", info.lastReason)});
            close_media();
            app_.handle_call_disconnected(getId());
        }
    } catch (const pj::Error& err) {
        logging::error("Call state handler error", {kv("reason", err.reason), kv("status", err.status)});
    } catch (const std::exception& ex) {
        logging::error(
            "Call state handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::onCallMediaState(pj::OnCallMediaStateParam& prm) {
    (void)prm;
    try {
        if (!media_active_) {
            open_media();
        }
    } catch (const std::exception& ex) {
        logging::error(
            "Call media handler exception",
            {kv("error", ex.what())});
    }
}

void SipCall::onCallTransferStatus(pj::OnCallTransferStatusParam& prm) {
    logging::info(
        "Transfer status",
        {kv("status", prm.statusCode),
         kv("reason", prm.reason),
         kv("final_notify", prm.finalNotify)});
    if (prm.finalNotify) {
        if (prm.statusCode >= 200 && prm.statusCode < 300) {
            try {
                hangup(PJSIP_SC_OK);
            } catch (const pj::Error& err) {
                logging::warn("Hangup after transfer failed", {kv("reason", err.reason)});
            }
        }
        prm.cont = false;
    }
}

void SipCall::open_media() {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (media_active_) {
        return;
    }
    try {
        audio_media_ = std::make_unique<pj::AudioMedia>(getAudioMedia(-1));
    } catch (const pj::Error& ex) {
        logging::error(
            "Call media not available",
            {kv("reason", ex.reason),
             kv("status", ex.status)});
        return;
    }

    const auto& config = app_.config();
    pj::MediaFormatAudio format;
    format.type = PJMEDIA_TYPE_AUDIO;
    format.clockRate = static_cast<unsigned>(config.stt_sample_rate);
    format.channelCount = 1;
    format.bitsPerSample = 16;
    format.frameTimeUsec = static_cast<unsigned>(config.frame_time_usec);

    const auto info = make_info();
    std::weak_ptr<SipCall> weak = shared_from_this();
    SipMediaTransport::CallOps ops;
    ops.hangup = [weak]() {
        if (auto call = weak.lock()) {
            call->hangup(PJSIP_SC_OK);
        }
    };
    ops.transfer = [weak](const std::string& target) {
        if (auto call = weak.lock()) {
            call->transfer_to(target);
        }
    };
    transport_ = std::make_shared<SipMediaTransport>(
        "sip-" + std::to_string(getId()), info, config.stt_sample_rate,
        static_cast<size_t>(config.transport_send_queue_frames),
        static_cast<size_t>(config.transport_receive_queue_frames), std::move(ops));

    media_port_ = std::make_unique<CallMediaPort>();
    media_port_->createPort("port/call/" + std::to_string(getId()), format);
    std::weak_ptr<SipMediaTransport> weak_transport = transport_;
    media_port_->set_on_frame_received([weak_transport](std::vector<int16_t> samples) {
        if (auto transport = weak_transport.lock()) {
            transport->deliver(std::move(samples));
        }
    });
    media_port_->set_on_frame_requested([weak_transport]() {
        if (auto transport = weak_transport.lock()) {
            return transport->next_outbound();
        }
        return std::vector<int16_t>();
    });

    try {
        audio_media_->startTransmit(*media_port_);
        media_port_->startTransmit(*audio_media_);
    } catch (const pj::Error& ex) {
        logging::error("Failed to attach media port",
                       {kv("reason", ex.reason),
                        kv("status", ex.status)});
    }
    media_active_ = true;

    // Off the pjsip event thread.
    auto transport = transport_;
    auto* app = &app_;
    const auto call_id = getId();
    utils::run_async([app, transport, call_id]() { app->start_session(call_id, transport); });
}

void SipCall::close_media() {
    std::lock_guard<std::mutex> lock(media_mutex_);
    if (!media_active_) {
        return;
    }
    if (audio_media_ && media_port_) {
        try {
            audio_media_->stopTransmit(*media_port_);
            media_port_->stopTransmit(*audio_media_);
        } catch (const pj::Error& err) {
            logging::debug("Media detach failed", {kv("reason", err.reason)});
        }
    }
    if (transport_) {
        transport_->handle_disconnect();
    }
    media_port_.reset();
    audio_media_.reset();
    media_active_ = false;
}

}
