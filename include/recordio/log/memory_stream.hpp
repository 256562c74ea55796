#pragma once

/** \file memory_stream.hpp
 *  \brief Vector-backed ByteSink and ByteSource.
 */

#include <cstdint>
#include <utility>
#include <vector>

#include "recordio/log/stream.hpp"

namespace recordio::log {

class MemorySink final : public ByteSink {
public:
  MemorySink() = default;
  /** Continue an existing stream; writes append after `initial`. */
  explicit MemorySink(std::vector<std::uint8_t> initial) : bytes_(std::move(initial)) {}

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto position() const -> std::uint64_t override { return bytes_.size(); }
  auto flush(bool sync) -> std::expected<void, core::error> override;
  auto close(bool finalize) -> std::expected<void, core::error> override;

  const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
  bool is_closed() const noexcept { return closed_; }
  bool is_finalized() const noexcept { return finalized_; }

private:
  std::vector<std::uint8_t> bytes_;
  bool closed_{false};
  bool finalized_{false};
};

class MemorySource final : public ByteSource {
public:
  explicit MemorySource(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

  auto read(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> override;
  auto position() -> std::expected<std::uint64_t, core::error> override { return pos_; }
  auto seek(std::uint64_t offset) -> std::expected<void, core::error> override;

  std::uint64_t size() const noexcept { return bytes_.size(); }

private:
  std::vector<std::uint8_t> bytes_;
  std::uint64_t pos_{0};
};

} // namespace recordio::log
