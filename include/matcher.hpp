#pragma once

#include "breach.hpp"
#include "corpus.hpp"
#include "crackbank.hpp"
#include <vector>

namespace crackbank {

enum class match_mode { indexed, scan };

// All records with a leaked detail whose digest equals `query`. Each record at most once, in
// corpus order. Pointers refer into `db` and live as long as it does.
using match_list = std::vector<const breach_record*>;

// binary search of the corpus' digest index
match_list find_matches(const digest& query, const corpus& db);

// hashes every leaked detail of every record on each call
match_list scan_matches(const digest& query, const corpus& db);

inline match_list match(const digest& query, const corpus& db, match_mode mode) {
  return mode == match_mode::scan ? scan_matches(query, db) : find_matches(query, db);
}

} // namespace crackbank
