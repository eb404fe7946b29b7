#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <pjsua2.hpp>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/transport/outbound_queue.hpp"

namespace voice_gateway {
namespace sip {

// Conference-bridge port. pjmedia handles the codec and resampling, so frames
// arrive and leave as PCM at the port clock rate.
class CallMediaPort : public pj::AudioMediaPort {
public:
    using FrameHandler = std::function<void(std::vector<int16_t>)>;
    using FrameProvider = std::function<std::vector<int16_t>()>;

    void set_on_frame_received(FrameHandler handler);
    void set_on_frame_requested(FrameProvider handler);

    void onFrameRequested(pj::MediaFrame& frame) override;
    void onFrameReceived(pj::MediaFrame& frame) override;

private:
    FrameHandler on_frame_received_;
    FrameProvider on_frame_requested_;
    std::mutex handler_mutex_;
};

class SipMediaTransport : public transport::MediaTransport {
public:
    struct CallOps {
        std::function<void()> hangup;
        std::function<void(const std::string&)> transfer;
    };

    SipMediaTransport(std::string connection_id,
                      transport::TransportInfo info,
                      int sample_rate,
                      size_t send_queue_frames,
                      size_t receive_queue_frames,
                      CallOps ops);
    ~SipMediaTransport() override;

    // Port side, called from the pjmedia clock thread.
    void deliver(std::vector<int16_t> samples);
    std::vector<int16_t> next_outbound();

    // The SIP dialog ended.
    void handle_disconnect();

    std::optional<audio::AudioFrame> receive() override;
    void send(audio::AudioFrame frame) override;
    void clear() override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    bool degraded() const override { return outbound_.degraded(); }

    transport::TransportInfo info() const override { return info_; }
    int inbound_sample_rate() const override { return sample_rate_; }
    int outbound_sample_rate() const override { return sample_rate_; }
    std::string connection_id() const override { return connection_id_; }

    void hangup() override;
    void transfer(const std::string& target) override;

private:
    std::string connection_id_;
    transport::TransportInfo info_;
    int sample_rate_;
    CallOps ops_;
    logging::Context log_;

    pipeline::BoundedQueue<audio::AudioFrame> inbound_;
    transport::OutboundAudioQueue outbound_;
    std::atomic<uint64_t> next_sequence_{0};
    std::atomic<bool> inbound_overflow_{false};
    std::atomic<bool> open_{true};
    std::atomic<bool> closed_{false};
};

}
}
