#pragma once

#include "error.hpp"
#include <restinio/http_headers.hpp>
#include <string>
#include <utility>
#include <vector>

namespace crackbank::srv {

using header_list = std::vector<std::pair<std::string, std::string>>;

// exact match against the allow list. An absent (empty) origin is never allowed.
bool origin_allowed(const std::string& origin, const std::vector<std::string>& allowed);

// headers for every response: empty unless the origin is allowed
header_list cors_headers(const std::string& origin, const std::vector<std::string>& allowed);

// OPTIONS reply headers. request_headers is the client's Access-Control-Request-Headers
header_list preflight_headers(const std::string& origin, const std::string& request_headers,
                              const std::vector<std::string>& allowed);

restinio::http_status_line_t status_for(errc code);

} // namespace crackbank::srv
