#include "voice_gateway/server/rest_server.hpp"

#include <map>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/metrics.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

RestServer::RestServer(const Config& config, session::SessionManager& sessions)
    : config_(config), sessions_(sessions) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}, {"active_sessions", sessions_.active_count()}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/voice", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            res.set_content(voice_twiml(req), "application/xml");
            logging::info("Incoming call answered",
                          {kv("call_sid", req.get_param_value("CallSid")),
                           kv("from", req.get_param_value("From"))});
        } catch (const std::exception& ex) {
            logging::error("Failed to handle /voice request", {kv("error", ex.what())});
            res.status = 500;
            res.set_content("<Response><Hangup/></Response>", "application/xml");
        }
    });

    server_->Get("/sessions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, {200, {{"sessions", sessions_.list()}}});
    });

    server_->Post(R"(/sessions/([A-Za-z0-9_-]+)/hangup)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto session_id = req.matches[1].str();
        try {
            if (!sessions_.hangup(session_id)) {
                write_json(res, {404, {{"message", "session not found"}}});
                return;
            }
            write_json(res, {200, {{"session_id", session_id}, {"status", "hanging_up"}}});
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle hangup request",
                {kv("session_id", session_id), kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"hangup failed"})", "application/json");
        }
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server failed to listen", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

std::string RestServer::voice_twiml(const httplib::Request& request) const {
    std::string public_url;
    if (config_.public_url) {
        public_url = *config_.public_url;
    } else {
        const auto host = request.get_header_value("Host");
        if (host.empty()) {
            throw std::runtime_error("PUBLIC_URL is not set and the request has no Host header");
        }
        public_url = "https://" + host;
    }
    const auto stream_url = utils::websocket_url(public_url, config_.media_stream_path);

    std::map<std::string, std::string> parameters;
    for (const char* name : {"From", "To", "CallSid"}) {
        if (request.has_param(name)) {
            parameters[name] = request.get_param_value(name);
        }
    }
    return telephony::build_connect_twiml(stream_url, parameters);
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
