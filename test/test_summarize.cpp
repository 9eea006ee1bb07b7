#include "breach.hpp"
#include "error.hpp"
#include "summarize.hpp"
#include "gtest/gtest.h"
#include <string>
#include <utility>
#include <vector>

struct canned_summarizer : crackbank::summarizer {
  explicit canned_summarizer(std::string reply_) : reply(std::move(reply_)) {}

  std::string summarize(const crackbank::prompt& p) override {
    prompts.push_back(p);
    return reply;
  }

  std::string                    reply;
  std::vector<crackbank::prompt> prompts;
};

const std::vector<crackbank::breach_match> two_matches{
    {"BankLeak2023", "2023-01-01", crackbank::risk_level::high, "Backup server exposed."},
    {"CardSkim2022", "", crackbank::risk_level::unknown, ""},
};

TEST(summarize, prompt_enumerates_matches) { // NOLINT
  auto p = crackbank::build_prompt(two_matches);

  EXPECT_EQ(p.user_text, "My banking detail was found in these breach(es):\n\n"
                         "Breach 1:\n"
                         "- Source: BankLeak2023\n"
                         "- Date: 2023-01-01\n"
                         "- Risk Level: high\n"
                         "- Description: Backup server exposed.\n\n"
                         "Breach 2:\n"
                         "- Source: CardSkim2022\n"
                         "- Date: N/A\n"
                         "- Risk Level: N/A\n"
                         "- Description: N/A\n\n"
                         "Summarize the situation and provide a prioritized list of 3-5 "
                         "recommended actions.");
  EXPECT_NE(p.system_text.find("'Cypher'"), std::string::npos);
  EXPECT_NE(p.system_text.find("Markdown headings"), std::string::npos);
}

TEST(summarize, prompt_is_deterministic) { // NOLINT
  auto first  = crackbank::build_prompt(two_matches);
  auto second = crackbank::build_prompt(two_matches);
  EXPECT_EQ(first.system_text, second.system_text);
  EXPECT_EQ(first.user_text, second.user_text);
}

TEST(summarize, forwards_prompt_and_returns_text) { // NOLINT
  canned_summarizer ai{"## What happened\nStay calm."};
  EXPECT_EQ(crackbank::summarize_matches(two_matches, ai), "## What happened\nStay calm.");
  ASSERT_EQ(ai.prompts.size(), 1U);
  EXPECT_EQ(ai.prompts[0].user_text, crackbank::build_prompt(two_matches).user_text);
}

TEST(summarize, no_matches_is_no_data) { // NOLINT
  canned_summarizer ai{"unused"};
  try {
    auto text = crackbank::summarize_matches({}, ai);
    FAIL() << "summarized nothing into: " << text;
  } catch (const crackbank::error& e) {
    EXPECT_EQ(e.code(), crackbank::errc::no_data_provided);
  }
  EXPECT_TRUE(ai.prompts.empty()); // never bothered the collaborator
}

TEST(summarize, blank_reply_is_upstream_unavailable) { // NOLINT
  for (const std::string reply: {"", "  \n\t"}) {
    canned_summarizer ai{reply};
    try {
      auto text = crackbank::summarize_matches(two_matches, ai);
      FAIL() << "accepted blank reply: '" << text << "'";
    } catch (const crackbank::error& e) {
      EXPECT_EQ(e.code(), crackbank::errc::upstream_unavailable);
    }
  }
}

TEST(error, http_status_mapping) { // NOLINT
  EXPECT_EQ(crackbank::http_status(crackbank::errc::invalid_digest_format), 400U);
  EXPECT_EQ(crackbank::http_status(crackbank::errc::no_data_provided), 400U);
  EXPECT_EQ(crackbank::http_status(crackbank::errc::malformed_request), 400U);
  EXPECT_EQ(crackbank::http_status(crackbank::errc::upstream_unavailable), 503U);
  EXPECT_EQ(crackbank::http_status(crackbank::errc::misconfigured_credential), 500U);
  EXPECT_EQ(crackbank::to_string(crackbank::errc::no_data_provided), "no_data_provided");
}
