#include "summarize.hpp"
#include "breach.hpp"
#include "error.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <vector>

namespace crackbank {

prompt build_prompt(const std::vector<breach_match>& matches) {
  std::string details;
  std::size_t n = 1;
  for (const auto& m: matches) {
    std::string_view risk = m.risk_text;
    if (risk.empty()) {
      risk = m.risk == risk_level::unknown ? std::string_view{"N/A"} : to_string(m.risk);
    }
    details += fmt::format("Breach {}:\n"
                           "- Source: {}\n"
                           "- Date: {}\n"
                           "- Risk Level: {}\n"
                           "- Description: {}\n\n",
                           n++, or_na(m.source), or_na(m.date), risk,
                           or_na(m.description));
  }

  return {
      "You are a world-class cybersecurity analyst named 'Cypher'. "
      "Explain to a non-technical user whose banking information was found in a breach. "
      "Keep it serious, clear, and actionable. Use Markdown headings.",

      fmt::format("My banking detail was found in these breach(es):\n\n{}"
                  "Summarize the situation and provide a prioritized list of 3-5 recommended "
                  "actions.",
                  details),
  };
}

std::string summarize_matches(const std::vector<breach_match>& matches, summarizer& s) {
  if (matches.empty()) {
    throw error(errc::no_data_provided, "No breach data provided.");
  }
  std::string summary = s.summarize(build_prompt(matches));
  if (summary.find_first_not_of(" \t\r\n") == std::string::npos) {
    throw error(errc::upstream_unavailable, "AI model returned empty response.");
  }
  return summary;
}

} // namespace crackbank
