#include "crackbank.hpp"
#include "error.hpp"
#include "gtest/gtest.h"
#include <sstream>
#include <string>

// expects normalize() to fail with invalid_digest_format
void expect_rejected(const std::string& input) {
  SCOPED_TRACE("input: '" + input + "'");
  try {
    auto d = crackbank::normalize(input);
    FAIL() << "accepted as " << d;
  } catch (const crackbank::error& e) {
    EXPECT_EQ(e.code(), crackbank::errc::invalid_digest_format);
  }
}

TEST(digest, known_sha1) { // NOLINT
  EXPECT_EQ(crackbank::digest_of("abc").to_string(), "a9993e364706816aba3e25717850c26c9cd0d89d");
  EXPECT_EQ(crackbank::digest_of("").to_string(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
  EXPECT_EQ(crackbank::digest_of("1234567890123456").to_string(),
            "deed2a88e73dccaa30a9e6e296f62be238be4ade");
}

TEST(digest, digest_of_is_deterministic) { // NOLINT
  for (const std::string p: {"1234567890123456", "GB29NWBK60161331926819", "x", " padded "}) {
    auto first  = crackbank::digest_of(p);
    auto second = crackbank::digest_of(p);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.to_string().size(), 40U);
    EXPECT_TRUE(crackbank::is_valid_digest(first.to_string()));
  }
}

TEST(digest, plaintext_is_hashed_verbatim) { // NOLINT
  EXPECT_NE(crackbank::digest_of("abc"), crackbank::digest_of("ABC"));
  EXPECT_NE(crackbank::digest_of("abc"), crackbank::digest_of(" abc"));
}

TEST(digest, normalize_trims_and_lowercases) { // NOLINT
  auto d = crackbank::normalize("  A9993E364706816ABA3E25717850C26C9CD0D89D\t\n");
  EXPECT_EQ(d, crackbank::digest_of("abc"));
  EXPECT_EQ(d.to_string(), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(digest, normalize_is_idempotent) { // NOLINT
  for (const std::string x: {"a9993e364706816aba3e25717850c26c9cd0d89d",
                             " DEED2A88E73DCCAA30A9E6E296F62BE238BE4ADE ",
                             "Da39a3eE5e6b4b0d3255bfef95601890afd80709"}) {
    auto once  = crackbank::normalize(x);
    auto twice = crackbank::normalize(once.to_string());
    EXPECT_EQ(once, twice);
    EXPECT_EQ(once.to_string(), twice.to_string());
  }
}

TEST(digest, normalize_rejects_bad_input) { // NOLINT
  expect_rejected("");
  expect_rejected("   \t ");
  expect_rejected("not-a-digest");
  expect_rejected("a9993e364706816aba3e25717850c26c9cd0d89");   // 39
  expect_rejected("a9993e364706816aba3e25717850c26c9cd0d89d0"); // 41
  expect_rejected("g9993e364706816aba3e25717850c26c9cd0d89d");  // not hex
  expect_rejected("a9993e36 4706816aba3e25717850c26c9cd0d89d"); // inner space
}

TEST(digest, is_valid_digest_does_not_trim) { // NOLINT
  EXPECT_TRUE(crackbank::is_valid_digest("A9993E364706816ABA3E25717850C26C9CD0D89D"));
  EXPECT_FALSE(crackbank::is_valid_digest(" a9993e364706816aba3e25717850c26c9cd0d89d"));
}

TEST(digest, ordering_and_stream_output) { // NOLINT
  const crackbank::digest low{"0000000000000000000000000000000000000010"};
  const crackbank::digest high{"0000000000000000000000000000000000000020"};
  EXPECT_LT(low, high);

  std::stringstream out;
  out << high;
  EXPECT_EQ(out.str(), "0000000000000000000000000000000000000020");
}
