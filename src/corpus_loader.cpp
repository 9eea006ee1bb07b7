#include "corpus_loader.hpp"
#include "breach.hpp"
#include "corpus.hpp"
#include "log.hpp"
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <json/json.h>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace crackbank {

namespace {

std::string string_member(const Json::Value& entry, const char* name) {
  const Json::Value& member = entry[name];
  return member.isString() ? member.asString() : std::string{};
}

std::vector<breach_record> extract_records(const Json::Value& root) {
  std::vector<breach_record> records;
  for (const auto& source: root.getMemberNames()) {
    const Json::Value& entry = root[source];
    if (!entry.isObject()) {
      logger.warn(fmt::format("corpus: skipping '{}', not an object", source));
      continue;
    }

    breach_record record;
    record.source      = source;
    record.date        = string_member(entry, "date");
    record.description = string_member(entry, "description");

    const std::string risk = string_member(entry, "risk_level");
    record.risk            = parse_risk_level(risk);
    if (record.risk == risk_level::unknown && !risk.empty()) {
      logger.warn(fmt::format("corpus: '{}' has unrecognised risk_level '{}'", source, risk));
    }

    const Json::Value& details = entry["leaked_details"];
    if (details.isArray()) {
      for (const auto& detail: details) {
        if (!detail.isString() || detail.asString().empty()) {
          logger.warn(fmt::format("corpus: '{}' has an unusable leaked detail, skipped", source));
          continue;
        }
        record.leaked_details.push_back(detail.asString());
      }
    } else if (!details.isNull()) {
      logger.warn(fmt::format("corpus: '{}' leaked_details is not an array", source));
    }
    records.push_back(std::move(record));
  }
  return records;
}

} // namespace

corpus parse_corpus(const std::string& json_text) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;

  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errs;
  if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errs)) {
    logger.warn(fmt::format("corpus: malformed json, using empty corpus: {}", errs));
    return {};
  }
  if (!root.isObject()) {
    logger.warn("corpus: top level is not an object, using empty corpus");
    return {};
  }

  try {
    return corpus{extract_records(root)};
  } catch (const std::exception& e) {
    logger.warn(fmt::format("corpus: rejected, using empty corpus: {}", e.what()));
    return {};
  }
}

corpus load_corpus(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    logger.warn(fmt::format("corpus: cannot open {}, no known breaches", path.string()));
    return {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    logger.warn(fmt::format("corpus: error reading {}, no known breaches", path.string()));
    return {};
  }

  auto loaded = parse_corpus(buffer.str());
  logger.log(fmt::format("corpus: loaded {} breaches, {} leaked details from {}", loaded.size(),
                         loaded.identifier_count(), path.string()));
  return loaded;
}

} // namespace crackbank
