#include "notify.hpp"
#include "breach.hpp"
#include <fmt/format.h>
#include <mutex>
#include <string>
#include <vector>

namespace crackbank {

void console_notifier::notify(const std::string& target, const std::vector<breach_match>& matches) {
  std::string mail = fmt::format("\n--- SIMULATED EMAIL NOTIFICATION ---\n"
                                 "To: {}\n"
                                 "From: security@crack-bank.local\n"
                                 "Subject: URGENT: Security Alert - Breach Detected\n"
                                 "{:-<35}\n",
                                 target, "");
  for (const auto& m: matches) {
    mail += fmt::format("- Source: {} | Date: {}\n", or_na(m.source), or_na(m.date));
  }
  mail += "--- END OF SIMULATED EMAIL ---\n\n";

  const std::lock_guard lk(mutex_);
  os_ << mail << std::flush;
}

} // namespace crackbank
