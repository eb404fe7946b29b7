#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/http/client.hpp"
#include "voice_gateway/utils/http.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace voice_gateway;
using testing::wait_until;

namespace {

class LocalServer {
public:
    LocalServer() {
        server.Get("/ping", [this](const httplib::Request&, httplib::Response& response) {
            ++hits;
            response.set_content(R"({"ok":true})", "application/json");
        });
        server.Post("/slow", [this](const httplib::Request&, httplib::Response& response) {
            ++hits;
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            response.set_content(R"({"id":"evt_1"})", "application/json");
        });
        server.Get("/broken", [](const httplib::Request&, httplib::Response& response) {
            response.status = 500;
            response.set_content("backend down", "text/plain");
        });
        port = server.bind_to_any_port("127.0.0.1");
        listener = std::thread([this]() { server.listen_after_bind(); });
        wait_until([this]() { return server.is_running(); });
    }

    ~LocalServer() {
        server.stop();
        listener.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port); }

    httplib::Server server;
    std::thread listener;
    int port = 0;
    std::atomic<int> hits{0};
};

HttpRequestOptions short_timeouts() {
    HttpRequestOptions options;
    options.request_timeout = std::chrono::seconds(2);
    options.connect_timeout = std::chrono::seconds(2);
    options.read_timeout = std::chrono::seconds(2);
    return options;
}

}

TEST_CASE("json responses are parsed and errors carry the status") {
    LocalServer local;
    HttpClient client(local.url(), short_timeouts());
    REQUIRE(client.get_json("/ping")["ok"] == true);
    try {
        client.get_json("/broken");
        FAIL("expected HttpError");
    } catch (const HttpError& ex) {
        REQUIRE(ex.status() == 500);
        REQUIRE(std::string(ex.what()).find("backend down") != std::string::npos);
    }
}

TEST_CASE("a cancelled token stops the request before it is sent") {
    LocalServer local;
    HttpClient client(local.url(), short_timeouts());
    pipeline::CancelToken token;
    client.set_cancel_token(token);
    token.cancel();

    REQUIRE_THROWS_AS(client.post_json("/slow", {{"title", "Demo"}}), pipeline::OperationCancelled);
    REQUIRE_THROWS_AS(client.get_json("/ping"), pipeline::OperationCancelled);
    REQUIRE(local.hits == 0);
}

TEST_CASE("a response that arrives after cancellation is discarded") {
    LocalServer local;
    HttpClient client(local.url(), short_timeouts());
    pipeline::CancelToken token;
    client.set_cancel_token(token);
    std::thread canceller([token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.cancel();
    });

    REQUIRE_THROWS_AS(client.post_json("/slow", {{"title", "Demo"}}), pipeline::OperationCancelled);
    canceller.join();
    REQUIRE(local.hits == 1);
}

TEST_CASE("certificate checks follow the process setting") {
    REQUIRE(utils::tls_verification_enabled());
    REQUIRE(HttpRequestOptions{}.verify_certificates);

    utils::set_tls_verification(false);
    REQUIRE_FALSE(HttpRequestOptions{}.verify_certificates);
    utils::set_tls_verification(true);
    REQUIRE(HttpRequestOptions{}.verify_certificates);
}
