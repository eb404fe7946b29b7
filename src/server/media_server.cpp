#include "voice_gateway/server/media_server.hpp"

#include <map>
#include <mutex>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"

namespace voice_gateway {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

}

struct MediaStreamServer::WsState {
    WsServer server;
    std::mutex mutex;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<transport::MediaStreamTransport>,
             std::owner_less<websocketpp::connection_hdl>> transports;
    uint64_t next_connection = 0;

    std::shared_ptr<transport::MediaStreamTransport> find(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = transports.find(hdl);
        return it == transports.end() ? nullptr : it->second;
    }

    std::shared_ptr<transport::MediaStreamTransport> remove(websocketpp::connection_hdl hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = transports.find(hdl);
        if (it == transports.end()) {
            return nullptr;
        }
        auto transport = it->second;
        transports.erase(it);
        return transport;
    }
};

MediaStreamServer::MediaStreamServer(const Config& config,
                                     std::shared_ptr<telephony::TelephonyService> telephony,
                                     session::SessionManager& sessions)
    : config_(config),
      telephony_(std::move(telephony)),
      sessions_(sessions),
      ws_state_(std::make_unique<WsState>()) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

transport::MediaStreamOptions MediaStreamServer::transport_options() const {
    transport::MediaStreamOptions options;
    options.wire_sample_rate = config_.telephony_sample_rate;
    options.pcm_sample_rate = config_.stt_sample_rate;
    options.frame_ms = config_.frame_duration_ms;
    options.send_queue_frames = static_cast<size_t>(config_.transport_send_queue_frames);
    options.receive_queue_frames = static_cast<size_t>(config_.transport_receive_queue_frames);
    options.jitter_depth_frames = static_cast<size_t>(config_.jitter_depth_frames);
    options.max_gap_fill_frames = static_cast<size_t>(config_.max_gap_fill_frames);
    return options;
}

void MediaStreamServer::start() {
    if (running_.exchange(true)) {
        return;
    }
    auto& state = *ws_state_;
    auto& server = state.server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this, &state](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto connection = state.server.get_con_from_hdl(hdl, ec);
        if (ec) {
            return false;
        }
        const auto resource = connection->get_resource();
        const auto path = resource.substr(0, resource.find('?'));
        if (path != config_.media_stream_path) {
            logging::warn("Media stream rejected, unknown path", {kv("path", path)});
            return false;
        }
        return true;
    });

    server.set_open_handler([this, &state](websocketpp::connection_hdl hdl) {
        std::string connection_id;
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            connection_id = "ws-" + std::to_string(++state.next_connection);
        }
        auto sender = [&state, hdl](const std::string& text) {
            websocketpp::lib::error_code ec;
            state.server.send(hdl, text, websocketpp::frame::opcode::text, ec);
            return !ec;
        };
        auto closer = [&state, hdl]() {
            websocketpp::lib::error_code ec;
            state.server.close(hdl, websocketpp::close::status::normal, "call ended", ec);
        };
        auto transport = std::make_shared<transport::MediaStreamTransport>(
            connection_id, sender, closer, telephony_, transport_options());
        std::weak_ptr<transport::MediaStreamTransport> weak = transport;
        transport->set_on_start([this, weak]() {
            auto started = weak.lock();
            if (!started) {
                return;
            }
            try {
                sessions_.start_session(started);
            } catch (const SessionLimitError& ex) {
                logging::warn("Media stream refused", {kv("connection_id", started->connection_id()),
                                                       kv("reason", ex.what())});
                Metrics::instance().increment("session_rejected");
                started->close();
            } catch (const std::exception& ex) {
                logging::error("Failed to start session", {kv("connection_id", started->connection_id()),
                                                           kv("error", ex.what())});
                started->close();
            }
        });
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.transports[hdl] = transport;
        }
        logging::info("Media stream connected", {kv("connection_id", connection_id)});
    });

    server.set_message_handler([&state](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        auto transport = state.find(hdl);
        if (!transport) {
            return;
        }
        transport->handle_message(msg->get_payload());
    });

    const auto on_gone = [&state](websocketpp::connection_hdl hdl) {
        auto transport = state.remove(hdl);
        if (!transport) {
            return;
        }
        logging::info("Media stream disconnected", {kv("connection_id", transport->connection_id())});
        transport->handle_close();
    };
    server.set_close_handler(on_gone);
    server.set_fail_handler(on_gone);

    websocketpp::lib::error_code ec;
    server.listen(static_cast<uint16_t>(config_.media_stream_port), ec);
    if (ec) {
        running_ = false;
        throw TransportError("Media stream server cannot listen on port " +
                             std::to_string(config_.media_stream_port) + ": " + ec.message());
    }
    server.start_accept(ec);
    if (ec) {
        running_ = false;
        throw TransportError("Media stream server accept failed: " + ec.message());
    }
    server_thread_ = std::thread([this]() {
        logging::info("Media stream server listening",
                      {kv("port", config_.media_stream_port), kv("path", config_.media_stream_path)});
        try {
            ws_state_->server.run();
        } catch (const std::exception& ex) {
            logging::error("Media stream server stopped", {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    auto& state = *ws_state_;
    websocketpp::lib::error_code ec;
    state.server.stop_listening(ec);
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<transport::MediaStreamTransport>,
             std::owner_less<websocketpp::connection_hdl>> open;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        open.swap(state.transports);
    }
    for (auto& item : open) {
        item.second->handle_close();
        state.server.close(item.first, websocketpp::close::status::going_away, "shutdown", ec);
    }
    state.server.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

}
