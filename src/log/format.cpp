#include "recordio/log/format.hpp"

namespace recordio::log {

static_assert(unmask_crc(mask_crc(0u)) == 0u);
static_assert(unmask_crc(mask_crc(0xFFFFFFFFu)) == 0xFFFFFFFFu);
static_assert(mask_crc(0u) != 0u, "masked CRC of zero must not read as zero-fill");
static_assert(MAX_FRAGMENT_LENGTH <= 0xFFFFu, "fragment length must fit the u16 length field");

auto to_string(RecordType t) noexcept -> const char* {
  switch (t) {
    case RecordType::none: return "NONE";
    case RecordType::full: return "FULL";
    case RecordType::first: return "FIRST";
    case RecordType::middle: return "MIDDLE";
    case RecordType::last: return "LAST";
  }
  return "UNKNOWN";
}

static auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0])
       | (static_cast<std::uint32_t>(p[1]) << 8)
       | (static_cast<std::uint32_t>(p[2]) << 16)
       | (static_cast<std::uint32_t>(p[3]) << 24);
}

static auto load_le16(const std::uint8_t* p) -> std::uint16_t {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

auto encode_header(const RecordHeader& h) noexcept -> HeaderBytes {
  HeaderBytes out{};
  out[0] = static_cast<std::uint8_t>(h.masked_crc & 0xFFu);
  out[1] = static_cast<std::uint8_t>((h.masked_crc >> 8) & 0xFFu);
  out[2] = static_cast<std::uint8_t>((h.masked_crc >> 16) & 0xFFu);
  out[3] = static_cast<std::uint8_t>((h.masked_crc >> 24) & 0xFFu);
  out[4] = static_cast<std::uint8_t>(h.length & 0xFFu);
  out[5] = static_cast<std::uint8_t>(h.length >> 8);
  out[6] = h.type;
  return out;
}

auto decode_header(std::span<const std::uint8_t, HEADER_LENGTH> bytes) noexcept -> RecordHeader {
  const std::uint8_t* p = bytes.data();
  return RecordHeader{load_le32(p), load_le16(p + 4), p[6]};
}

} // namespace recordio::log
