#pragma once

#include "breach.hpp"
#include <string>
#include <vector>

namespace crackbank {

struct prompt {
  std::string system_text;
  std::string user_text;
};

// Turns a prompt into prose. Implementations talk to a language model. They throw
// crackbank::error with errc::upstream_unavailable or errc::misconfigured_credential.
class summarizer {
public:
  virtual ~summarizer() = default;

  virtual std::string summarize(const prompt& p) = 0;
};

// deterministic: same matches, same prompt
prompt build_prompt(const std::vector<breach_match>& matches);

// throws crackbank::error: no_data_provided for no matches, upstream_unavailable for a blank
// summary, and whatever `s` throws
std::string summarize_matches(const std::vector<breach_match>& matches, summarizer& s);

} // namespace crackbank
