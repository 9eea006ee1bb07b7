#include "gemini.hpp"
#include "error.hpp"
#include "log.hpp"
#include "summarize.hpp"
#include <cstddef>
#include <curl/curl.h>
#include <fmt/format.h>
#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crackbank {

namespace {

struct curl_result {
  long        status = 0;
  std::string body;
};

curl_result curl_sync_post(const std::string& url, const std::string& payload, long timeout_secs) {
  const std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                                  &curl_easy_cleanup);
  if (!curl) {
    throw error(errc::upstream_unavailable, "Error communicating with AI service: no curl handle");
  }

  const std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
      curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

  // can't put inline as setopt is a macro which fails
  auto write_cb = [](char* ptr, std::size_t size, std::size_t nmemb, void* body) {
    *static_cast<std::string*>(body) += std::string_view{ptr, size * nmemb};
    return size * nmemb;
  };

  curl_result result;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, +write_cb); // convert to func ptr
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_secs);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // called from server worker threads

  if (auto res = curl_easy_perform(curl.get()); res != CURLE_OK) {
    throw error(errc::upstream_unavailable,
                fmt::format("Error communicating with AI service: {}", curl_easy_strerror(res)));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
  return result;
}

} // namespace

std::string make_gemini_payload(const prompt& p) {
  Json::Value user_part;
  user_part["text"] = p.user_text;
  Json::Value content;
  content["parts"].append(user_part);

  Json::Value system_part;
  system_part["text"] = p.system_text;

  Json::Value payload;
  payload["contents"].append(content);
  payload["systemInstruction"]["parts"].append(system_part);

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, payload);
}

std::string parse_gemini_response(const std::string& body) {
  Json::CharReaderBuilder                 builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs) || !root.isObject()) {
    throw error(errc::upstream_unavailable, "AI model returned an unreadable response.");
  }

  const Json::Value& candidates = root["candidates"];
  if (!candidates.isArray() || candidates.empty()) {
    throw error(errc::upstream_unavailable, "AI model returned empty response.");
  }
  // const operator[] on a non-object throws Json::LogicError, so check every level first
  const Json::Value& candidate = candidates[0];
  if (!candidate.isObject() || !candidate["content"].isObject()) {
    throw error(errc::upstream_unavailable, "AI model returned empty response.");
  }
  const Json::Value& parts = candidate["content"]["parts"];
  if (!parts.isArray() || parts.empty() || !parts[0].isObject() || !parts[0]["text"].isString() ||
      parts[0]["text"].asString().empty()) {
    throw error(errc::upstream_unavailable, "AI model returned empty response.");
  }
  return parts[0]["text"].asString();
}

std::string gemini_summarizer::url() const {
  return fmt::format("{}/models/{}:generateContent", config_.endpoint, config_.model);
}

std::string gemini_summarizer::summarize(const prompt& p) {
  if (config_.api_key.empty()) {
    throw error(errc::misconfigured_credential, "Google API key not configured.");
  }

  logger.log(fmt::format("summarize: POST {}", url()));
  auto response =
      curl_sync_post(fmt::format("{}?key={}", url(), config_.api_key), make_gemini_payload(p),
                     static_cast<long>(config_.timeout.count()));

  if (response.status >= 400) {
    throw error(errc::upstream_unavailable,
                fmt::format("Error communicating with AI service: http status {}", response.status));
  }
  return parse_gemini_response(response.body);
}

void init_curl() {
  if (curl_global_init(CURL_GLOBAL_ALL) != 0) {
    throw std::runtime_error("Error: Could not init curl");
  }
}

void shutdown_curl() { curl_global_cleanup(); }

} // namespace crackbank
