#include "recordio/log/crc32c.hpp"

#include <array>

namespace recordio::log {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

static inline auto update_state(std::uint32_t state, std::span<const std::uint8_t> bytes) noexcept
    -> std::uint32_t {
  for (auto b : bytes) {
    state = CRC32C_TABLE[(state ^ b) & 0xFFu] ^ (state >> 8);
  }
  return state;
}

// Seed CRC for each type tag so a record CRC is one extend over the payload.
static constexpr std::array<std::uint32_t, MAX_RECORD_TYPE + 1> TYPE_CRC = []{
  std::array<std::uint32_t, MAX_RECORD_TYPE + 1> t{};
  for (std::uint32_t i = 0; i < t.size(); ++i) {
    const std::uint32_t s = ~0u;
    t[i] = ~(CRC32C_TABLE[(s ^ i) & 0xFFu] ^ (s >> 8));
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  return ~update_state(~0u, bytes);
}

auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  return ~update_state(~crc, bytes);
}

auto record_crc(std::uint8_t type, std::span<const std::uint8_t> payload) noexcept -> std::uint32_t {
  if (type <= MAX_RECORD_TYPE) {
    return crc32c_extend(TYPE_CRC[type], payload);
  }
  Crc32c c;
  c.update(type);
  c.update(payload);
  return c.value();
}

void Crc32c::update(std::uint8_t byte) noexcept {
  state_ = CRC32C_TABLE[(state_ ^ byte) & 0xFFu] ^ (state_ >> 8);
}

void Crc32c::update(std::span<const std::uint8_t> bytes) noexcept {
  state_ = update_state(state_, bytes);
}

} // namespace recordio::log
