#include "crackbank.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <sha1.h>
#include <string>
#include <string_view>

namespace crackbank {

digest normalize(std::string_view input) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";

  auto first = input.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    throw error(errc::invalid_digest_format, "Invalid SHA-1 hash provided.");
  }
  auto last = input.find_last_not_of(whitespace);
  std::string trimmed{input.substr(first, last - first + 1)};

  std::transform(trimmed.begin(), trimmed.end(), trimmed.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (!is_valid_digest(trimmed)) {
    throw error(errc::invalid_digest_format, "Invalid SHA-1 hash provided.");
  }
  return digest{trimmed};
}

digest digest_of(std::string_view plaintext) {
  SHA1 sha1;
  return digest{sha1(plaintext.data(), plaintext.size())};
}

} // namespace crackbank
