#include "report.hpp"
#include "breach.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "notify.hpp"
#include <exception>
#include <fmt/format.h>
#include <optional>
#include <string>

namespace crackbank {

match_result build_report(const match_list& matches) {
  match_result result;
  result.breached = !matches.empty();
  result.matches.reserve(matches.size());
  for (const auto* record: matches) {
    result.matches.push_back(to_match(*record));
  }
  return result;
}

match_result build_report(const match_list& matches, const std::optional<std::string>& target,
                          notifier& notify) {
  match_result result = build_report(matches);

  if (result.breached && target && !target->empty()) {
    try {
      notify.notify(*target, result.matches);
    } catch (const std::exception& e) {
      logger.error(fmt::format("notification for {} breaches failed: {}", result.matches.size(),
                               e.what()));
    }
  }
  return result;
}

} // namespace crackbank
