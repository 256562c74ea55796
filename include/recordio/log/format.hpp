#pragma once

/** \file format.hpp
 *  \brief Record log geometry: block size, physical header layout, type tags, CRC masking.
 *
 * Wire format (little-endian on all platforms):
 *   stream   := block*                      blocks of BLOCK_SIZE bytes from offset 0
 *   record   := crc:u32 length:u16 type:u8 payload[length]
 *   crc      := mask_crc(crc32c(type || payload))
 * A physical record never crosses a block boundary. A block tail shorter than
 * HEADER_LENGTH is zero-filled by writers and skipped by readers.
 *
 * Thread-safety: everything here is constexpr or stateless.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace recordio::log {

constexpr std::size_t BLOCK_SIZE = 32768;
constexpr std::size_t HEADER_LENGTH = 4 + 2 + 1; // crc + length + type
constexpr std::size_t MAX_FRAGMENT_LENGTH = BLOCK_SIZE - HEADER_LENGTH;

// Format compatibility constant shared by writers and readers (leveldb log format).
constexpr std::uint32_t CRC_MASK_DELTA = 0xA282EAD8u;

enum class RecordType : std::uint8_t {
  none = 0,   // block tail without room for a header; never a stored record
  full = 1,
  first = 2,
  middle = 3,
  last = 4,
};

constexpr std::uint8_t MAX_RECORD_TYPE = static_cast<std::uint8_t>(RecordType::last);

constexpr auto is_known_type(std::uint8_t tag) noexcept -> bool { return tag <= MAX_RECORD_TYPE; }

auto to_string(RecordType t) noexcept -> const char*;

/** \brief Rotate-and-add transform applied to a raw CRC before it is stored.
 *  A CRC of bytes that themselves embed CRCs, or of all-zero data, then no
 *  longer collides with the stored value.
 */
constexpr auto mask_crc(std::uint32_t crc) noexcept -> std::uint32_t {
  return ((crc >> 15) | (crc << 17)) + CRC_MASK_DELTA;
}

constexpr auto unmask_crc(std::uint32_t masked) noexcept -> std::uint32_t {
  const std::uint32_t rot = masked - CRC_MASK_DELTA;
  return (rot >> 17) | (rot << 15);
}

/** Bytes left in the block containing `offset`; in (0, BLOCK_SIZE]. */
constexpr auto bytes_to_block_end(std::uint64_t offset) noexcept -> std::size_t {
  return BLOCK_SIZE - static_cast<std::size_t>(offset % BLOCK_SIZE);
}

/** Offset of the first block boundary strictly after `offset`. */
constexpr auto next_block_boundary(std::uint64_t offset) noexcept -> std::uint64_t {
  return (offset / BLOCK_SIZE + 1) * BLOCK_SIZE;
}

struct RecordHeader {
  std::uint32_t masked_crc;
  std::uint16_t length;
  std::uint8_t type;       // raw tag; may be outside RecordType on corrupt input
};

using HeaderBytes = std::array<std::uint8_t, HEADER_LENGTH>;

auto encode_header(const RecordHeader& h) noexcept -> HeaderBytes;

auto decode_header(std::span<const std::uint8_t, HEADER_LENGTH> bytes) noexcept -> RecordHeader;

} // namespace recordio::log
