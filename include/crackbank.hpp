#pragma once

#include <array>
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace crackbank {

namespace detail {

constexpr std::byte make_nibble(char c) {
  assert((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f'));
  auto nibble = c - '0';
  if (nibble > 9) nibble = (nibble & ~('a' - 'A')) - ('A' - '0') + 10; // NOLINT signed
  assert(nibble >= 0 && nibble <= 15);
  return static_cast<std::byte>(nibble);
}

constexpr std::byte make_byte(char mschr, char lschr) {
  return make_nibble(mschr) << 4U | make_nibble(lschr);
}

constexpr char nibble_to_char(std::byte nibble) {
  auto n = std::to_integer<std::uint8_t>(nibble);
  assert(n <= 15);
  return static_cast<char>(n + (n < 10 ? '0' : 'a' - 10));
}

} // namespace detail

// sha1 of a sensitive identifier. Always rendered as 40 lowercase hex chars.
struct digest {
  constexpr static unsigned hash_size     = 20;
  constexpr static unsigned hash_str_size = hash_size * 2;

  digest() = default;

  // `hex` must already be a valid digest string, see is_valid_digest() / normalize()
  explicit digest(std::string_view hex) {
    assert(hex.length() == hash_str_size);
    std::size_t i = 0;
    for (auto& b: hash) {
      b = detail::make_byte(hex[2 * i], hex[2 * i + 1]);
      ++i;
    }
  }

  std::strong_ordering operator<=>(const digest& rhs) const = default;
  bool                 operator==(const digest& rhs) const  = default;

  [[nodiscard]] std::string to_string() const {
    std::string buffer(hash_str_size, '\0');
    char*       strptr = buffer.data();
    for (auto h: hash) {
      *strptr++ = detail::nibble_to_char(h >> 4U);
      *strptr++ = detail::nibble_to_char(h & std::byte(0x0FU));
    }
    return buffer;
  }

  friend std::ostream& operator<<(std::ostream& os, const digest& rhs) {
    return os << rhs.to_string();
  }

  std::array<std::byte, hash_size> hash{};
};

// true if `text` is exactly 40 lowercase or uppercase hex chars. No trimming.
inline bool is_valid_digest(std::string_view text) {
  return text.size() == digest::hash_str_size &&
         text.find_first_not_of("0123456789abcdefABCDEF") == std::string_view::npos;
}

// Trims surrounding whitespace and lowercases, then validates.
// throws crackbank::error{errc::invalid_digest_format}
digest normalize(std::string_view input);

// single unsalted sha1 pass over the plaintext bytes, exactly as stored in the corpus
digest digest_of(std::string_view plaintext);

} // namespace crackbank
