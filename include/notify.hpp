#pragma once

#include "breach.hpp"
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace crackbank {

// delivers "your detail was found" messages. May be called from many server threads at once.
class notifier {
public:
  virtual ~notifier() = default;

  virtual void notify(const std::string& target, const std::vector<breach_match>& matches) = 0;
};

// no mail server: writes the email it would have sent to a stream
class console_notifier : public notifier {
public:
  explicit console_notifier(std::ostream& os) : os_(os) {}

  void notify(const std::string& target, const std::vector<breach_match>& matches) override;

private:
  std::ostream& os_;
  std::mutex    mutex_;
};

} // namespace crackbank
