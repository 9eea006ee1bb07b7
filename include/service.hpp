#pragma once

#include "breach.hpp"
#include "corpus.hpp"
#include "matcher.hpp"
#include "notify.hpp"
#include "report.hpp"
#include "summarize.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crackbank {

// Fixed pause after each check, standing in for the cost of an external lookup. none() for tests.
class delay_policy {
public:
  static delay_policy none() { return delay_policy{std::chrono::milliseconds{0}}; }
  static delay_policy fixed(std::chrono::milliseconds pause) { return delay_policy{pause}; }

  void apply() const;

  [[nodiscard]] std::chrono::milliseconds pause() const { return pause_; }

private:
  explicit delay_policy(std::chrono::milliseconds pause) : pause_(pause) {}

  std::chrono::milliseconds pause_;
};

// The two calls offered to the http layer. Holds references only: `db`, `notify` and
// `summary_source` must outlive it. All methods are safe to call concurrently.
class breach_service {
public:
  breach_service(const corpus& db, notifier& notify, summarizer& summary_source,
                 delay_policy delay = delay_policy::none(), match_mode mode = match_mode::indexed)
      : db_(db), notify_(notify), summarizer_(summary_source), delay_(delay), mode_(mode) {}

  // throws crackbank::error{errc::invalid_digest_format}
  [[nodiscard]] match_result check_breach(std::string_view digest_hex,
                                          const std::optional<std::string>& notify_target) const;

  // see crackbank::summarize_matches
  [[nodiscard]] std::string summarize_matches(const std::vector<breach_match>& matches) const;

  [[nodiscard]] const corpus& breaches() const { return db_; }

private:
  const corpus& db_;
  notifier&     notify_;
  summarizer&   summarizer_;
  delay_policy  delay_;
  match_mode    mode_;
};

} // namespace crackbank
