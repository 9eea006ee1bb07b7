#include "srv/cors.hpp"
#include "error.hpp"
#include <algorithm>
#include <restinio/http_headers.hpp>
#include <string>
#include <vector>

namespace crackbank::srv {

bool origin_allowed(const std::string& origin, const std::vector<std::string>& allowed) {
  return !origin.empty() && std::find(allowed.begin(), allowed.end(), origin) != allowed.end();
}

header_list cors_headers(const std::string& origin, const std::vector<std::string>& allowed) {
  if (!origin_allowed(origin, allowed)) return {};
  return {
      {"Access-Control-Allow-Origin", origin},
      {"Access-Control-Allow-Credentials", "true"},
      {"Vary", "Origin"},
  };
}

header_list preflight_headers(const std::string& origin, const std::string& request_headers,
                              const std::vector<std::string>& allowed) {
  header_list headers = cors_headers(origin, allowed);
  headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  headers.emplace_back("Access-Control-Allow-Headers",
                       request_headers.empty() ? std::string{"*"} : request_headers);
  return headers;
}

restinio::http_status_line_t status_for(errc code) {
  switch (http_status(code)) {
  case 400:
    return restinio::status_bad_request();
  case 503:
    return restinio::status_service_unavailable();
  default:
    return restinio::status_internal_server_error();
  }
}

} // namespace crackbank::srv
