#pragma once

/** \file crc32c.hpp
 *  \brief CRC32C (Castagnoli, reflected polynomial 0x82F63B78), one-shot and incremental.
 *
 * Thread-safety: functions are stateless; a Crc32c accumulator is not shared.
 */

#include <cstdint>
#include <span>

#include "recordio/log/format.hpp"

namespace recordio::log {

// CRC32C over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

// Continue a finished CRC32C value over more bytes: crc32c_extend(crc32c(a), b) == crc32c(a || b)
auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

// CRC32C of the type tag followed by the payload, as stored (unmasked) in a physical record
auto record_crc(std::uint8_t type, std::span<const std::uint8_t> payload) noexcept -> std::uint32_t;

/** \brief Streaming accumulator; value() may be called at any point. */
class Crc32c {
public:
  void update(std::uint8_t byte) noexcept;
  void update(std::span<const std::uint8_t> bytes) noexcept;
  std::uint32_t value() const noexcept { return ~state_; }
  void reset() noexcept { state_ = ~0u; }

private:
  std::uint32_t state_{~0u};
};

} // namespace recordio::log
