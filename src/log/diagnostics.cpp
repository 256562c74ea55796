#include "recordio/log/diagnostics.hpp"

#include <iostream>

#include "recordio/core/platform_utils.hpp"

namespace recordio::log {

auto parse_log_level(std::string_view name, LogLevel fallback) noexcept -> LogLevel {
  using core::equals_ci;
  if (equals_ci(name, "off") || name == "0") return LogLevel::off;
  if (equals_ci(name, "warn") || equals_ci(name, "warning")) return LogLevel::warn;
  if (equals_ci(name, "debug") || equals_ci(name, "trace")) return LogLevel::debug;
  return fallback;
}

auto log_level() noexcept -> LogLevel {
  static const LogLevel level = []{
    const auto v = core::safe_getenv("RECORDIO_LOG_LEVEL");
    if (!v || v->empty()) return LogLevel::warn;
    return parse_log_level(*v, LogLevel::warn);
  }();
  return level;
}

auto stderr_corruption_observer() -> CorruptionObserver {
  return [](const CorruptionEvent& ev) {
    if (log_level() == LogLevel::off) return;
    std::cerr << "[recordio][reader] corruption at offset " << ev.offset << ": " << ev.reason
              << " (dropped " << ev.bytes_dropped << " bytes)" << std::endl;
  };
}

void debug_trace(std::string_view component, std::string_view message) {
  if (log_level() != LogLevel::debug) return;
  std::cerr << "[recordio][" << component << "] " << message << std::endl;
}

} // namespace recordio::log
