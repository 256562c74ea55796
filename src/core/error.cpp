#include "recordio/error.hpp"

namespace recordio::core {

auto to_string(error_code ec) noexcept -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
  }
  return "unknown";
}

} // namespace recordio::core
