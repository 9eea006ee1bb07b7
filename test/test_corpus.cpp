#include "breach.hpp"
#include "corpus.hpp"
#include "corpus_loader.hpp"
#include "crackbank.hpp"
#include "gtest/gtest.h"
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

class corpus_test : public testing::Test {
protected:
  corpus_test() : testdatadir{CRACKBANK_TEST_DATA_DIR} {}

  std::filesystem::path testdatadir;
};

TEST_F(corpus_test, load_sample_file) { // NOLINT
  auto db = crackbank::load_corpus(testdatadir / "breaches.json");

  ASSERT_EQ(db.size(), 3U);
  EXPECT_EQ(db.identifier_count(), 5U);

  auto records = db.records();
  // ascending source order, regardless of file order
  EXPECT_EQ(records[0].source, "AccountDump2021");
  EXPECT_EQ(records[1].source, "BankLeak2023");
  EXPECT_EQ(records[2].source, "CardSkim2022");

  EXPECT_EQ(records[1].date, "2023-01-01");
  EXPECT_EQ(records[1].risk, crackbank::risk_level::high);
  EXPECT_EQ(records[1].leaked_details,
            (std::vector<std::string>{"1234567890123456", "4111111111111111"}));
  EXPECT_EQ(records[2].risk, crackbank::risk_level::critical);
}

TEST_F(corpus_test, records_view_is_restartable) { // NOLINT
  auto db = crackbank::load_corpus(testdatadir / "breaches.json");

  std::vector<std::string> first_pass;
  for (const auto& r: db.records()) first_pass.push_back(r.source);
  std::vector<std::string> second_pass;
  for (const auto& r: db.records()) second_pass.push_back(r.source);

  EXPECT_EQ(first_pass, second_pass);
}

TEST_F(corpus_test, missing_file_gives_empty_corpus) { // NOLINT
  auto db = crackbank::load_corpus(testdatadir / "no_such_file.json");
  EXPECT_TRUE(db.empty());
  EXPECT_EQ(db.identifier_count(), 0U);
}

TEST(corpus, malformed_json_gives_empty_corpus) { // NOLINT
  EXPECT_TRUE(crackbank::parse_corpus("{ \"BankLeak2023\": { ").empty());
  EXPECT_TRUE(crackbank::parse_corpus("").empty());
  EXPECT_TRUE(crackbank::parse_corpus("[1, 2, 3]").empty());
  EXPECT_TRUE(crackbank::parse_corpus("\"breaches\"").empty());
}

TEST(corpus, bad_entries_are_skipped) { // NOLINT
  auto db = crackbank::parse_corpus(R"({
    "Broken": "not an object",
    "Partial": { "leaked_details": ["1111", "", 42, null, "2222"] },
    "Odd": { "risk_level": "apocalyptic", "leaked_details": "1234" }
  })");

  ASSERT_EQ(db.size(), 2U);
  auto odd     = db.records()[0];
  auto partial = db.records()[1];

  EXPECT_EQ(odd.source, "Odd");
  EXPECT_EQ(odd.risk, crackbank::risk_level::unknown);
  EXPECT_TRUE(odd.leaked_details.empty());

  EXPECT_EQ(partial.source, "Partial");
  EXPECT_EQ(partial.date, "");
  EXPECT_EQ(partial.description, "");
  EXPECT_EQ(partial.leaked_details, (std::vector<std::string>{"1111", "2222"}));
  EXPECT_EQ(db.identifier_count(), 2U);
}

TEST(corpus, constructor_enforces_invariants) { // NOLINT
  using crackbank::breach_record;

  EXPECT_THROW(crackbank::corpus({breach_record{.source = "A", .leaked_details = {"1"}},
                                  breach_record{.source = "A", .leaked_details = {"2"}}}),
               std::invalid_argument);

  EXPECT_THROW(crackbank::corpus({breach_record{.source = "A", .leaked_details = {"1", ""}}}),
               std::invalid_argument);
}

TEST(corpus, index_covers_every_leaked_detail) { // NOLINT
  using crackbank::breach_record;
  const crackbank::corpus db({
      breach_record{.source = "B", .leaked_details = {"x", "y"}},
      breach_record{.source = "A", .leaked_details = {"y", "z", "y"}},
  });

  ASSERT_EQ(db.identifier_count(), 5U);
  auto index = db.index();
  EXPECT_TRUE(std::is_sorted(index.begin(), index.end()));
  for (const auto& entry: index) {
    const auto& details = db.records()[entry.record].leaked_details;
    EXPECT_NE(std::find_if(details.begin(), details.end(),
                           [&](const auto& d) { return crackbank::digest_of(d) == entry.hash; }),
              details.end());
  }
}

TEST(risk_level, parse_and_print) { // NOLINT
  EXPECT_EQ(crackbank::parse_risk_level("LOW"), crackbank::risk_level::low);
  EXPECT_EQ(crackbank::parse_risk_level("Medium"), crackbank::risk_level::medium);
  EXPECT_EQ(crackbank::parse_risk_level("high"), crackbank::risk_level::high);
  EXPECT_EQ(crackbank::parse_risk_level("critical"), crackbank::risk_level::critical);
  EXPECT_EQ(crackbank::parse_risk_level(""), crackbank::risk_level::unknown);
  EXPECT_EQ(crackbank::parse_risk_level("severe"), crackbank::risk_level::unknown);
  EXPECT_EQ(crackbank::to_string(crackbank::risk_level::critical), "critical");
  EXPECT_EQ(crackbank::to_string(crackbank::risk_level::unknown), "unknown");
}
