#pragma once

/** \file diagnostics.hpp
 *  \brief Corruption reporting for the record reader.
 *
 * The reader holds no process-wide logger. It reports every dropped region
 * through the CorruptionObserver supplied in ReaderOptions; the default
 * observer writes one line per event to std::cerr, gated by RECORDIO_LOG_LEVEL:
 *   off   - silent
 *   warn  - corruption events (default)
 *   debug - corruption events plus resync traces
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace recordio::log {

enum class LogLevel : std::uint8_t { off, warn, debug };

/** Level parsed from RECORDIO_LOG_LEVEL on first use; unknown values mean warn. */
auto log_level() noexcept -> LogLevel;

/** Parse a level name (case-insensitive); unknown names yield `fallback`. */
auto parse_log_level(std::string_view name, LogLevel fallback) noexcept -> LogLevel;

struct CorruptionEvent {
  std::uint64_t offset;        /**< stream offset of the offending physical record */
  std::size_t bytes_dropped;   /**< payload bytes discarded, including a partial logical record */
  std::string_view reason;     /**< short description; valid only during the callback */
};

using CorruptionObserver = std::function<void(const CorruptionEvent&)>;

/** Observer printing "[recordio][reader] corruption at offset N: reason (dropped M bytes)". */
auto stderr_corruption_observer() -> CorruptionObserver;

/** One-line trace to std::cerr when log_level() is debug. */
void debug_trace(std::string_view component, std::string_view message);

} // namespace recordio::log
