#include "error.hpp"
#include <string_view>

namespace crackbank {

std::string_view to_string(errc code) {
  switch (code) {
  case errc::invalid_digest_format:
    return "invalid_digest_format";
  case errc::no_data_provided:
    return "no_data_provided";
  case errc::malformed_request:
    return "malformed_request";
  case errc::upstream_unavailable:
    return "upstream_unavailable";
  case errc::misconfigured_credential:
    return "misconfigured_credential";
  }
  return "unknown";
}

unsigned http_status(errc code) {
  switch (code) {
  case errc::invalid_digest_format:
  case errc::no_data_provided:
  case errc::malformed_request:
    return 400;
  case errc::upstream_unavailable:
    return 503;
  case errc::misconfigured_credential:
    return 500;
  }
  return 500;
}

} // namespace crackbank
