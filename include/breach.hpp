#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace crackbank {

enum class risk_level { unknown, low, medium, high, critical };

// case insensitive. Anything unrecognised is risk_level::unknown
risk_level parse_risk_level(std::string_view text);

std::string_view to_string(risk_level level);

struct breach_record {
  std::string              source;
  std::string              date;
  risk_level               risk = risk_level::unknown;
  std::string              description;
  std::vector<std::string> leaked_details;
};

// what a caller gets to see about a matched breach. Never the leaked details.
struct breach_match {
  std::string source;
  std::string date;
  risk_level  risk = risk_level::unknown;
  std::string description;
  std::string risk_text; // as a client sent it; printed verbatim in prompts when set

  bool operator==(const breach_match& rhs) const = default;
};

// for human readable output of optional fields
inline std::string_view or_na(const std::string& field) {
  return field.empty() ? std::string_view{"N/A"} : std::string_view{field};
}

inline breach_match to_match(const breach_record& record) {
  return {record.source, record.date, record.risk, record.description, {}};
}

} // namespace crackbank
