#include "voice_gateway/sip/media_port.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/sip/pj_thread.hpp"

namespace voice_gateway::sip {

void CallMediaPort::set_on_frame_received(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_received_ = std::move(handler);
}

void CallMediaPort::set_on_frame_requested(FrameProvider handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_frame_requested_ = std::move(handler);
}

void CallMediaPort::onFrameRequested(pj::MediaFrame& frame) {
    frame.type = PJMEDIA_FRAME_TYPE_AUDIO;
    FrameProvider provider;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        provider = on_frame_requested_;
    }
    if (!provider) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto data = provider();
    if (data.empty() || frame.size == 0) {
        frame.size = 0;
        frame.buf.clear();
        return;
    }
    const auto max_samples = static_cast<size_t>(frame.size / sizeof(int16_t));
    const auto copy_samples = std::min(max_samples, data.size());
    const auto copy_bytes = copy_samples * sizeof(int16_t);
    frame.buf.resize(copy_bytes);
    std::memcpy(frame.buf.data(), data.data(), copy_bytes);
    frame.size = static_cast<unsigned>(copy_bytes);
}

void CallMediaPort::onFrameReceived(pj::MediaFrame& frame) {
    FrameHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = on_frame_received_;
    }
    if (frame.buf.empty() || frame.size == 0 || !handler) {
        return;
    }
    const auto available_bytes = std::min(static_cast<size_t>(frame.size), frame.buf.size());
    std::vector<int16_t> samples(available_bytes / sizeof(int16_t));
    std::memcpy(samples.data(), frame.buf.data(), samples.size() * sizeof(int16_t));
    handler(std::move(samples));
}

SipMediaTransport::SipMediaTransport(std::string connection_id,
                                     transport::TransportInfo info,
                                     int sample_rate,
                                     size_t send_queue_frames,
                                     size_t receive_queue_frames,
                                     CallOps ops)
    : connection_id_(std::move(connection_id)),
      info_(std::move(info)),
      sample_rate_(sample_rate),
      ops_(std::move(ops)),
      log_({kv("connection_id", connection_id_), kv("call_id", info_.call_id)}),
      inbound_(receive_queue_frames),
      outbound_(send_queue_frames, connection_id_) {}

SipMediaTransport::~SipMediaTransport() {
    close();
}

void SipMediaTransport::deliver(std::vector<int16_t> samples) {
    if (!open_.load()) {
        return;
    }
    audio::AudioFrame frame;
    frame.sequence = next_sequence_++;
    frame.direction = audio::Direction::Inbound;
    frame.sample_rate = sample_rate_;
    frame.samples = std::move(samples);
    if (inbound_.try_push(std::move(frame)) == pipeline::PushResult::DroppedOldest &&
        !inbound_overflow_.exchange(true)) {
        log_.warn("SIP inbound queue overflow, dropping oldest frames");
    }
}

std::vector<int16_t> SipMediaTransport::next_outbound() {
    auto frame = outbound_.try_pop();
    if (!frame) {
        return {};
    }
    return std::move(frame->samples);
}

void SipMediaTransport::handle_disconnect() {
    log_.info("SIP call disconnected");
    open_ = false;
    inbound_.close();
    outbound_.close();
}

std::optional<audio::AudioFrame> SipMediaTransport::receive() {
    return inbound_.pop();
}

void SipMediaTransport::send(audio::AudioFrame frame) {
    if (!open_.load()) {
        return;
    }
    outbound_.push(std::move(frame));
}

void SipMediaTransport::clear() {
    const auto removed = outbound_.clear();
    log_.debug("Outbound audio cleared", {kv("frames", removed)});
}

void SipMediaTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    open_ = false;
    inbound_.close();
    outbound_.close();
    log_.info("SIP transport closed", {kv("dropped_frames", outbound_.dropped())});
}

void SipMediaTransport::hangup() {
    ensure_pj_thread_registered("voicegw_session");
    if (!ops_.hangup) {
        close();
        return;
    }
    try {
        ops_.hangup();
    } catch (const pj::Error& err) {
        throw TransportError("SIP hangup failed: " + err.reason);
    }
}

void SipMediaTransport::transfer(const std::string& target) {
    ensure_pj_thread_registered("voicegw_session");
    if (!ops_.transfer) {
        throw TransportError("SIP transfer unavailable");
    }
    try {
        ops_.transfer(target);
    } catch (const pj::Error& err) {
        throw TransportError("SIP transfer failed: " + err.reason);
    }
}

}
