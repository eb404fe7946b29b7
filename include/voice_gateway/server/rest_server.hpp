#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "voice_gateway/config.hpp"
#include "voice_gateway/session/session_manager.hpp"

namespace voice_gateway {

struct RestResponse {
    int status = 200;
    nlohmann::json body;
};

class RestServer {
public:
    RestServer(const Config& config, session::SessionManager& sessions);

    void start();
    void stop();

    // Answer for the provider's incoming-call webhook.
    std::string voice_twiml(const httplib::Request& request) const;

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    session::SessionManager& sessions_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
