#include "service.hpp"
#include "breach.hpp"
#include "crackbank.hpp"
#include "matcher.hpp"
#include "report.hpp"
#include "summarize.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace crackbank {

void delay_policy::apply() const {
  if (pause_.count() > 0) {
    std::this_thread::sleep_for(pause_);
  }
}

match_result breach_service::check_breach(std::string_view digest_hex,
                                          const std::optional<std::string>& notify_target) const {
  const digest needle = normalize(digest_hex);

  const match_list found = match(needle, db_, mode_);
  delay_.apply();
  return build_report(found, notify_target, notify_);
}

std::string breach_service::summarize_matches(const std::vector<breach_match>& matches) const {
  return crackbank::summarize_matches(matches, summarizer_);
}

} // namespace crackbank
