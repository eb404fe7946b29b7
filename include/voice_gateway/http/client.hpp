#pragma once

#include <chrono>
#include <functional>
#include <httplib.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_gateway/pipeline/cancellation.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& message, int status)
        : std::runtime_error(message), status_(status) {}

    // 0 when the request never produced a response.
    int status() const { return status_; }

private:
    int status_;
};

class HttpPermissionError : public HttpError {
public:
    explicit HttpPermissionError(const std::string& message) : HttpError(message, 403) {}
};

struct HttpRequestOptions {
    std::chrono::seconds request_timeout{60};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    bool verify_certificates = utils::tls_verification_enabled();
};

// Thin JSON client over cpp-httplib. Not safe for concurrent use; callers that may
// abandon a request on timeout create one client per request.
class HttpClient {
public:
    using ChunkReceiver = std::function<bool(const char* data, size_t size)>;

    HttpClient(const std::string& base_url, HttpRequestOptions options);
    ~HttpClient();

    void set_bearer_token(const std::string& token);
    void set_basic_auth(const std::string& user, const std::string& password);
    void set_header(const std::string& name, const std::string& value);
    // Requests stop reading once token is cancelled and throw
    // pipeline::OperationCancelled, even if a response already arrived.
    void set_cancel_token(pipeline::CancelToken token);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json post_form(const std::string& path, const httplib::Params& params);
    nlohmann::json post_multipart(const std::string& path,
                                  const httplib::MultipartFormDataItems& items);

    // Streams the response body to receiver. Returns false when the receiver
    // stopped the transfer.
    bool post_json_streaming(const std::string& path,
                             const nlohmann::json& body,
                             const ChunkReceiver& receiver);

    std::string build_path(const std::string& path) const;

private:
    httplib::Headers make_headers(const std::string& accept) const;
    nlohmann::json send_json(httplib::Request& request);
    nlohmann::json check_response(const httplib::Result& result, const std::string& path) const;
    nlohmann::json parse_body(int status, const std::string& body, const std::string& path) const;
    void check_cancelled(const std::string& path) const;
    template <typename Fn>
    auto with_client(Fn&& fn) {
        if (https_) {
            return fn(*https_);
        }
        return fn(*http_);
    }
    template <typename T>
    void apply_options(T& client) const {
        client.set_connection_timeout(options_.connect_timeout.count(), 0);
        client.set_read_timeout(options_.read_timeout.count(), 0);
        client.set_write_timeout(options_.request_timeout.count(), 0);
    }

    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    HttpRequestOptions options_;
    std::optional<std::string> bearer_token_;
    httplib::Headers extra_headers_;
    std::optional<pipeline::CancelToken> cancel_;
    std::unique_ptr<httplib::Client> http_;
    std::unique_ptr<httplib::SSLClient> https_;
};

}
