#include "breach.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace crackbank {

risk_level parse_risk_level(std::string_view text) {
  std::string lower{text};
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "low") return risk_level::low;
  if (lower == "medium") return risk_level::medium;
  if (lower == "high") return risk_level::high;
  if (lower == "critical") return risk_level::critical;
  return risk_level::unknown;
}

std::string_view to_string(risk_level level) {
  switch (level) {
  case risk_level::low:
    return "low";
  case risk_level::medium:
    return "medium";
  case risk_level::high:
    return "high";
  case risk_level::critical:
    return "critical";
  case risk_level::unknown:
    break;
  }
  return "unknown";
}

} // namespace crackbank
