#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "voice_gateway/audio/codec.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/transport/jitter_buffer.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/transport/outbound_queue.hpp"

namespace voice_gateway {
namespace transport {

struct MediaStreamOptions {
    int wire_sample_rate = 8000;
    int pcm_sample_rate = 16000;
    int frame_ms = 20;
    size_t send_queue_frames = 50;
    size_t receive_queue_frames = 500;
    size_t jitter_depth_frames = 3;
    size_t max_gap_fill_frames = 50;
};

// Twilio Media Streams framing over one WebSocket connection. The socket itself is
// owned by the server; this class sees text messages in and hands text messages out.
class MediaStreamTransport : public MediaTransport {
public:
    using TextSender = std::function<bool(const std::string&)>;
    using EventHandler = std::function<void()>;

    MediaStreamTransport(std::string connection_id,
                         TextSender sender,
                         EventHandler close_connection,
                         std::shared_ptr<telephony::TelephonyService> telephony,
                         MediaStreamOptions options);
    ~MediaStreamTransport() override;

    // Called once the stream `start` event has filled in the call info.
    void set_on_start(EventHandler handler);

    void handle_message(const std::string& text);
    // The WebSocket went away; no more messages will arrive.
    void handle_close();

    std::optional<audio::AudioFrame> receive() override;
    void send(audio::AudioFrame frame) override;
    void clear() override;
    void close() override;
    bool is_open() const override;
    bool degraded() const override;

    TransportInfo info() const override;
    int inbound_sample_rate() const override { return options_.pcm_sample_rate; }
    int outbound_sample_rate() const override { return options_.wire_sample_rate; }
    std::string connection_id() const override { return connection_id_; }

    void hangup() override;
    void transfer(const std::string& target) override;

private:
    void on_start(const nlohmann::json& message);
    void on_media(const nlohmann::json& message);
    void on_stop();
    void finish_inbound();
    void writer_loop();
    bool send_json(const nlohmann::json& message);
    std::string stream_sid() const;

    std::string connection_id_;
    TextSender sender_;
    EventHandler close_connection_;
    std::shared_ptr<telephony::TelephonyService> telephony_;
    MediaStreamOptions options_;
    logging::Context log_;

    mutable std::mutex info_mutex_;
    TransportInfo info_;
    EventHandler on_start_;

    std::mutex inbound_mutex_;
    JitterBuffer jitter_;
    audio::Resampler upsampler_;
    uint64_t next_local_sequence_ = 0;
    bool inbound_finished_ = false;
    pipeline::BoundedQueue<audio::AudioFrame> inbound_;
    std::atomic<bool> inbound_overflow_{false};

    OutboundAudioQueue outbound_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> clear_generation_{0};
    std::thread writer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> open_{true};
    std::atomic<bool> closed_{false};
};

}
}
