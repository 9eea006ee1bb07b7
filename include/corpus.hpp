#pragma once

#include "breach.hpp"
#include "crackbank.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace crackbank {

// The known breaches. Built once, never modified afterwards, so safe to share between threads
// by const reference.
//
// Records are held in ascending `source` order, which is the order matches are reported in.
// Construction also builds a "digest index": every leaked detail hashed once and kept sorted,
// so lookups are a binary search rather than hashing the whole corpus per query.
class corpus {
public:
  struct index_entry {
    digest      hash;
    std::size_t record; // position in records()

    auto operator<=>(const index_entry& rhs) const = default;
  };

  corpus() = default;

  // throws std::invalid_argument on duplicate sources or empty leaked details
  explicit corpus(std::vector<breach_record> records);

  [[nodiscard]] std::span<const breach_record> records() const { return records_; }
  [[nodiscard]] std::span<const index_entry>   index() const { return index_; }

  [[nodiscard]] std::size_t size() const { return records_.size(); }
  [[nodiscard]] bool        empty() const { return records_.empty(); }
  [[nodiscard]] std::size_t identifier_count() const { return index_.size(); }

private:
  std::vector<breach_record> records_;
  std::vector<index_entry>   index_;
};

} // namespace crackbank
