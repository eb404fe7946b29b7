#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "voice_gateway/config.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/transport/media_stream_transport.hpp"

namespace voice_gateway {

// WebSocket endpoint for provider media streams. Each connection gets a
// MediaStreamTransport; the session starts once the stream `start` event arrives.
class MediaStreamServer {
public:
    MediaStreamServer(const Config& config,
                      std::shared_ptr<telephony::TelephonyService> telephony,
                      session::SessionManager& sessions);
    ~MediaStreamServer();

    void start();
    void stop();

private:
    struct WsState;

    transport::MediaStreamOptions transport_options() const;

    const Config& config_;
    std::shared_ptr<telephony::TelephonyService> telephony_;
    session::SessionManager& sessions_;
    std::unique_ptr<WsState> ws_state_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
};

}
