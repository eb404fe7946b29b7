#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace voice_gateway::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

std::string resolve_redirect_url(const std::string& base_url,
                                 const std::string& location);

// Maps http(s)://host/base to ws(s)://host/base + path.
std::string websocket_url(const std::string& public_url, const std::string& path);

std::string url_encode(const std::string& value);
std::string build_query(const std::map<std::string, std::string>& params);
std::string xml_escape(const std::string& value);

// Server certificate checks for outgoing HTTPS. On unless TLS_VERIFY turns them off.
void set_tls_verification(bool enabled);
bool tls_verification_enabled();

// Follows up to five redirects. Returns false and logs on any failure.
bool download_file(const std::string& url, const std::filesystem::path& path);

}
