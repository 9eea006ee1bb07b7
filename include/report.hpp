#pragma once

#include "breach.hpp"
#include "matcher.hpp"
#include "notify.hpp"
#include <optional>
#include <string>
#include <vector>

namespace crackbank {

struct match_result {
  bool                      breached = false;
  std::vector<breach_match> matches;
};

match_result build_report(const match_list& matches);

// Also tells `notify` about the breaches, once, if there are any and a target was given.
// A failing notifier is logged and otherwise ignored: the caller still gets its result.
match_result build_report(const match_list& matches, const std::optional<std::string>& target,
                          notifier& notify);

} // namespace crackbank
