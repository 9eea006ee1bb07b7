#pragma once

#include "breach.hpp"
#include "report.hpp"
#include <optional>
#include <string>
#include <vector>

namespace crackbank::srv {

// POST /check-breach-hash  {"hash": "...", "email": "...", "last4": "..."}
// last4 is accepted for front-end compatibility and not used.
struct check_request {
  std::string                hash;
  std::optional<std::string> email;
};

// request parsers throw crackbank::error: malformed_request for a body that is not a json object
// or has wrongly typed fields
check_request parse_check_request(const std::string& body);

// POST /summarize-breach  {"breach_data": [{"source": ..., "date": ..., ...}, ...]}
// additionally throws no_data_provided for a missing or empty breach_data
std::vector<breach_match> parse_summarize_request(const std::string& body);

std::string to_json(const match_result& result);
std::string summary_json(const std::string& summary);
std::string detail_json(const std::string& detail);
// for unexpected failures. Never carries the exception text
std::string internal_error_json();
std::string status_json();

} // namespace crackbank::srv
