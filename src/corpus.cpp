#include "corpus.hpp"
#include "breach.hpp"
#include "crackbank.hpp"
#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>
#include <vector>

namespace crackbank {

corpus::corpus(std::vector<breach_record> records) : records_(std::move(records)) {
  std::sort(records_.begin(), records_.end(),
            [](const breach_record& a, const breach_record& b) { return a.source < b.source; });

  auto dupe = std::adjacent_find(
      records_.begin(), records_.end(),
      [](const breach_record& a, const breach_record& b) { return a.source == b.source; });
  if (dupe != records_.end()) {
    throw std::invalid_argument(fmt::format("duplicate breach source '{}'", dupe->source));
  }

  std::size_t total = 0;
  for (const auto& record: records_) total += record.leaked_details.size();
  index_.reserve(total);

  for (std::size_t i = 0; i != records_.size(); ++i) {
    for (const auto& detail: records_[i].leaked_details) {
      if (detail.empty()) {
        throw std::invalid_argument(
            fmt::format("breach source '{}' has an empty leaked detail", records_[i].source));
      }
      index_.push_back({digest_of(detail), i});
    }
  }
  // (hash, record) order => equal hashes are grouped and each group is in corpus order
  std::sort(index_.begin(), index_.end());
}

} // namespace crackbank
