#include "srv/payload.hpp"
#include "breach.hpp"
#include "error.hpp"
#include "report.hpp"
#include <fmt/format.h>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crackbank::srv {

namespace {

Json::Value parse_object(const std::string& body) {
  Json::CharReaderBuilder                 builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
    throw error(errc::malformed_request, fmt::format("Request body is not valid json: {}", errs));
  }
  if (!root.isObject()) {
    throw error(errc::malformed_request, "Request body must be a json object.");
  }
  return root;
}

// absent and null are both "not given"
std::optional<std::string> optional_string(const Json::Value& obj, const char* name) {
  const Json::Value& member = obj[name];
  if (member.isNull()) return std::nullopt;
  if (!member.isString()) {
    throw error(errc::malformed_request, fmt::format("Field '{}' must be a string.", name));
  }
  return member.asString();
}

std::string write(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value string_or_null(const std::string& field) {
  return field.empty() ? Json::Value{Json::nullValue} : Json::Value{field};
}

} // namespace

check_request parse_check_request(const std::string& body) {
  const Json::Value root = parse_object(body);

  auto hash = optional_string(root, "hash");
  if (!hash) {
    throw error(errc::malformed_request, "Field 'hash' is required.");
  }
  return {*hash, optional_string(root, "email")};
}

std::vector<breach_match> parse_summarize_request(const std::string& body) {
  const Json::Value  root = parse_object(body);
  const Json::Value& data = root["breach_data"];

  if (data.isNull() || (data.isArray() && data.empty())) {
    throw error(errc::no_data_provided, "No breach data provided.");
  }
  if (!data.isArray()) {
    throw error(errc::malformed_request, "Field 'breach_data' must be an array.");
  }

  std::vector<breach_match> matches;
  for (const auto& item: data) {
    if (!item.isObject()) {
      throw error(errc::malformed_request, "Each breach_data item must be an object.");
    }
    breach_match m;
    m.source      = optional_string(item, "source").value_or("");
    m.date        = optional_string(item, "date").value_or("");
    m.risk_text   = optional_string(item, "risk_level").value_or("");
    m.risk        = parse_risk_level(m.risk_text);
    m.description = optional_string(item, "description").value_or("");
    matches.push_back(std::move(m));
  }
  return matches;
}

std::string to_json(const match_result& result) {
  Json::Value root;
  root["breached"] = result.breached;
  if (result.breached) {
    Json::Value& breaches = root["breaches"];
    breaches              = Json::Value{Json::arrayValue};
    for (const auto& m: result.matches) {
      Json::Value item;
      item["source"]      = m.source;
      item["date"]        = string_or_null(m.date);
      item["risk_level"]  = std::string{to_string(m.risk)};
      item["description"] = string_or_null(m.description);
      breaches.append(item);
    }
  }
  return write(root);
}

std::string summary_json(const std::string& summary) {
  Json::Value root;
  root["summary"] = summary;
  return write(root);
}

std::string detail_json(const std::string& detail) {
  Json::Value root;
  root["detail"] = detail;
  return write(root);
}

std::string internal_error_json() { return detail_json("Internal server error."); }

std::string status_json() {
  Json::Value root;
  root["status"] = "Crack Bank API is running";
  return write(root);
}

} // namespace crackbank::srv
