#pragma once

#include "summarize.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace crackbank {

struct gemini_config_t {
  std::string          api_key;
  std::string          endpoint = "https://generativelanguage.googleapis.com/v1beta";
  std::string          model    = "gemini-2.5-flash-preview-05-20";
  std::chrono::seconds timeout{30};
};

// Google generative language api, one blocking https request per summary.
// Stateless between calls and therefore safe to share between server threads, once
// init_curl() has run.
class gemini_summarizer : public summarizer {
public:
  explicit gemini_summarizer(gemini_config_t config) : config_(std::move(config)) {}

  std::string summarize(const prompt& p) override;

  [[nodiscard]] std::string url() const; // without the key

private:
  gemini_config_t config_;
};

// request body for generateContent
std::string make_gemini_payload(const prompt& p);

// candidates[0].content.parts[0].text, or throws crackbank::error{errc::upstream_unavailable}
std::string parse_gemini_response(const std::string& body);

// process wide libcurl setup. Call before starting any threads.
void init_curl();
void shutdown_curl();

} // namespace crackbank
