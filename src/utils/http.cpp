#include "voice_gateway/utils/http.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <httplib.h>
#include <iomanip>
#include <memory>
#include <sstream>

#include "voice_gateway/logging.hpp"

namespace voice_gateway::utils {

namespace {

constexpr int kMaxRedirects = 5;

std::atomic<bool> verify_tls{true};

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

httplib::Result fetch(const std::string& url) {
    std::string scheme;
    std::string host;
    std::string path;
    int port = 0;
    parse_url(url, scheme, host, port, path);
    const httplib::Headers headers = {{"User-Agent", "voice-gateway/0.1"}, {"Accept", "*/*"}};
    if (scheme == "https") {
        httplib::SSLClient client(host, port);
        client.enable_server_certificate_verification(tls_verification_enabled());
        client.set_url_encode(false);
        return client.Get(path, headers);
    }
    httplib::Client client(host, port);
    client.set_url_encode(false);
    return client.Get(path, headers);
}

bool write_file(const std::filesystem::path& path, const std::string& body) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    std::ofstream out(path, std::ios::binary);
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.close();
    return static_cast<bool>(out);
}

}

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string rest = url;
    scheme = "http";
    base_path = "/";
    host.clear();
    port = 0;

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        scheme = rest.substr(0, scheme_end);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        rest.erase(0, scheme_end + 3);
    }

    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        base_path = rest.substr(slash);
        rest.resize(slash);
    }

    const auto colon = rest.find(':');
    host = rest.substr(0, colon);
    if (colon != std::string::npos) {
        port = std::stoi(rest.substr(colon + 1));
    } else {
        port = (scheme == "https" || scheme == "wss") ? 443 : 80;
    }
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool secure = scheme == "https" || scheme == "wss";
    const bool default_port = (secure && port == 443) || (!secure && port == 80);
    if (port > 0 && !default_port) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location) {
    if (location.empty()) {
        return "";
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    parse_url(base_url, scheme, host, port, base_path);
    if (location.front() == '/') {
        return build_url(scheme, host, port, location);
    }
    const auto last_slash = base_path.find_last_of('/');
    const std::string directory =
        last_slash == std::string::npos ? "/" : base_path.substr(0, last_slash + 1);
    return build_url(scheme, host, port, directory + location);
}

std::string websocket_url(const std::string& public_url, const std::string& path) {
    std::string scheme;
    std::string host;
    std::string base_path;
    int port = 0;
    parse_url(public_url, scheme, host, port, base_path);
    const std::string ws_scheme = (scheme == "https" || scheme == "wss") ? "wss" : "ws";
    std::string full_path = base_path == "/" ? "" : base_path;
    if (!full_path.empty() && full_path.back() == '/') {
        full_path.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        full_path += '/';
    }
    full_path += path;
    return build_url(ws_scheme, host, port, full_path);
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string build_query(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(key) + "=" + url_encode(value);
    }
    return query;
}

std::string xml_escape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped.push_back(ch);
        }
    }
    return escaped;
}

void set_tls_verification(bool enabled) {
    verify_tls.store(enabled);
}

bool tls_verification_enabled() {
    return verify_tls.load();
}

bool download_file(const std::string& url, const std::filesystem::path& path) {
    std::string current = url;
    for (int hop = 0; hop <= kMaxRedirects; ++hop) {
        auto response = fetch(current);
        if (!response) {
            logging::error("Download request failed",
                           {kv("url", current), kv("error", httplib::to_string(response.error()))});
            return false;
        }
        if (response->status >= 200 && response->status < 300) {
            if (!write_file(path, response->body)) {
                logging::error("Download write failed", {kv("path", path.string())});
                return false;
            }
            logging::info("Downloaded file",
                          {kv("url", url), kv("path", path.string()),
                           kv("bytes", response->body.size())});
            return true;
        }
        if (!is_redirect(response->status)) {
            logging::error("Download failed",
                           {kv("status", response->status), kv("url", current),
                            kv("response", response->body.substr(0, 256))});
            return false;
        }
        const auto location = response->get_header_value("Location");
        const auto next = resolve_redirect_url(current, location);
        if (next.empty()) {
            logging::error("Download redirect without location",
                           {kv("status", response->status), kv("url", current)});
            return false;
        }
        logging::debug("Download redirect", {kv("from", current), kv("to", next)});
        current = next;
    }
    logging::error("Download failed: too many redirects", {kv("url", url)});
    return false;
}

}
