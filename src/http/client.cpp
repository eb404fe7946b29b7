#include "voice_gateway/http/client.hpp"

#include <utility>

#include "voice_gateway/utils/http.hpp"

namespace voice_gateway {

namespace {

bool is_success(int status) {
    return status >= 200 && status < 300;
}

std::string snippet(const std::string& body) {
    const size_t limit = 256;
    return body.size() > limit ? body.substr(0, limit) : body;
}

}

HttpClient::HttpClient(const std::string& base_url, HttpRequestOptions options)
    : options_(options) {
    utils::parse_url(base_url, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw HttpError("Invalid URL: " + base_url, 0);
    }
    if (base_path_ == "/") {
        base_path_.clear();
    }
    if (scheme_ == "https") {
        https_ = std::make_unique<httplib::SSLClient>(host_, port_);
        https_->enable_server_certificate_verification(options_.verify_certificates);
        apply_options(*https_);
    } else {
        http_ = std::make_unique<httplib::Client>(host_, port_);
        apply_options(*http_);
    }
}

HttpClient::~HttpClient() = default;

void HttpClient::set_bearer_token(const std::string& token) {
    if (token.empty()) {
        bearer_token_.reset();
        return;
    }
    bearer_token_ = token;
}

void HttpClient::set_basic_auth(const std::string& user, const std::string& password) {
    with_client([&](auto& client) {
        client.set_basic_auth(user, password);
        return 0;
    });
}

void HttpClient::set_header(const std::string& name, const std::string& value) {
    extra_headers_.emplace(name, value);
}

void HttpClient::set_cancel_token(pipeline::CancelToken token) {
    cancel_ = std::move(token);
}

nlohmann::json HttpClient::get_json(const std::string& path) {
    httplib::Request request;
    request.method = "GET";
    request.path = build_path(path);
    request.headers = make_headers("application/json");
    return send_json(request);
}

nlohmann::json HttpClient::post_json(const std::string& path, const nlohmann::json& body) {
    httplib::Request request;
    request.method = "POST";
    request.path = build_path(path);
    request.headers = make_headers("application/json");
    request.headers.emplace("Content-Type", "application/json");
    request.body = body.dump();
    return send_json(request);
}

nlohmann::json HttpClient::post_form(const std::string& path, const httplib::Params& params) {
    const auto full_path = build_path(path);
    const auto headers = make_headers("application/json");
    check_cancelled(full_path);
    auto result = with_client([&](auto& client) {
        return client.Post(full_path, headers, params);
    });
    check_cancelled(full_path);
    return check_response(result, full_path);
}

nlohmann::json HttpClient::post_multipart(const std::string& path,
                                          const httplib::MultipartFormDataItems& items) {
    const auto full_path = build_path(path);
    const auto headers = make_headers("application/json");
    check_cancelled(full_path);
    auto result = with_client([&](auto& client) {
        return client.Post(full_path, headers, items);
    });
    check_cancelled(full_path);
    return check_response(result, full_path);
}

nlohmann::json HttpClient::send_json(httplib::Request& request) {
    check_cancelled(request.path);
    std::string body;
    const auto token = cancel_;
    request.response_handler = [token](const httplib::Response&) {
        return !token || !token->cancelled();
    };
    request.content_receiver = [token, &body](const char* data, size_t size,
                                              uint64_t /*offset*/, uint64_t /*total*/) {
        if (token && token->cancelled()) {
            return false;
        }
        body.append(data, size);
        return true;
    };

    httplib::Response response;
    httplib::Error error = httplib::Error::Success;
    const bool ok = with_client([&](auto& client) {
        return client.send(request, response, error);
    });
    check_cancelled(request.path);
    if (!ok) {
        throw HttpError("HTTP request to " + request.path + " failed: " + httplib::to_string(error), 0);
    }
    return parse_body(response.status, body, request.path);
}

bool HttpClient::post_json_streaming(const std::string& path,
                                     const nlohmann::json& body,
                                     const ChunkReceiver& receiver) {
    httplib::Request request;
    request.method = "POST";
    request.path = build_path(path);
    request.headers = make_headers("*/*");
    request.headers.emplace("Content-Type", "application/json");
    request.body = body.dump();
    request.response_handler = [](const httplib::Response& response) {
        return is_success(response.status);
    };
    const auto token = cancel_;
    request.content_receiver = [&receiver, token](const char* data, size_t size,
                                                  uint64_t /*offset*/, uint64_t /*total*/) {
        if (token && token->cancelled()) {
            return false;
        }
        return receiver(data, size);
    };

    check_cancelled(request.path);
    httplib::Response response;
    httplib::Error error = httplib::Error::Success;
    const bool ok = with_client([&](auto& client) {
        return client.send(request, response, error);
    });
    check_cancelled(request.path);
    if (ok) {
        return true;
    }
    if (error == httplib::Error::Canceled && is_success(response.status)) {
        return false;
    }
    if (response.status > 0 && !is_success(response.status)) {
        if (response.status == 403) {
            throw HttpPermissionError("HTTP 403 from " + request.path);
        }
        throw HttpError("HTTP " + std::to_string(response.status) + " from " + request.path,
                        response.status);
    }
    throw HttpError("HTTP request failed: " + httplib::to_string(error), 0);
}

std::string HttpClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

httplib::Headers HttpClient::make_headers(const std::string& accept) const {
    httplib::Headers headers{{"Accept", accept}};
    if (bearer_token_) {
        headers.emplace("Authorization", "Bearer " + *bearer_token_);
    }
    for (const auto& header : extra_headers_) {
        headers.emplace(header.first, header.second);
    }
    return headers;
}

nlohmann::json HttpClient::check_response(const httplib::Result& result,
                                          const std::string& path) const {
    if (!result) {
        throw HttpError("HTTP request to " + path + " failed: " +
                            httplib::to_string(result.error()),
                        0);
    }
    return parse_body(result->status, result->body, path);
}

nlohmann::json HttpClient::parse_body(int status, const std::string& body, const std::string& path) const {
    if (status == 403) {
        throw HttpPermissionError(snippet(body));
    }
    if (!is_success(status)) {
        throw HttpError("HTTP " + std::to_string(status) + " from " + path + ": " + snippet(body), status);
    }
    if (body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        throw HttpError("Invalid JSON from " + path + ": " + ex.what(), status);
    }
}

void HttpClient::check_cancelled(const std::string& path) const {
    if (cancel_) {
        cancel_->throw_if_cancelled("HTTP request to " + path);
    }
}

}
