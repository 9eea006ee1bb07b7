#include "matcher.hpp"
#include "breach.hpp"
#include "corpus.hpp"
#include "crackbank.hpp"
#include <algorithm>
#include <cstddef>
#include <limits>

namespace crackbank {

match_list find_matches(const digest& query, const corpus& db) {
  const auto index = db.index();

  auto [first, last] = std::equal_range(
      index.begin(), index.end(), corpus::index_entry{query, 0},
      [](const corpus::index_entry& a, const corpus::index_entry& b) { return a.hash < b.hash; });

  match_list found;
  const auto records = db.records();

  // entries for one hash are sorted by record, so repeats are adjacent
  std::size_t last_record = std::numeric_limits<std::size_t>::max();
  for (auto iter = first; iter != last; ++iter) {
    if (iter->record != last_record) {
      found.push_back(&records[iter->record]);
      last_record = iter->record;
    }
  }
  return found;
}

match_list scan_matches(const digest& query, const corpus& db) {
  match_list found;
  for (const auto& record: db.records()) {
    auto hit = std::find_if(record.leaked_details.begin(), record.leaked_details.end(),
                            [&](const auto& detail) { return digest_of(detail) == query; });
    if (hit != record.leaked_details.end()) {
      found.push_back(&record); // once per record, however many details match
    }
  }
  return found;
}

} // namespace crackbank
