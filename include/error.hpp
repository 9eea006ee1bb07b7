#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace crackbank {

enum class errc {
  invalid_digest_format,
  no_data_provided,
  malformed_request,
  upstream_unavailable,
  misconfigured_credential,
};

std::string_view to_string(errc code);

// status code the http layer answers with for each kind of failure
unsigned http_status(errc code);

class error : public std::runtime_error {
public:
  error(errc code, const std::string& what) : std::runtime_error(what), code_(code) {}

  [[nodiscard]] errc code() const noexcept { return code_; }

private:
  errc code_;
};

} // namespace crackbank
