#include "recordio/log/memory_stream.hpp"

#include <algorithm>
#include <cstring>

namespace recordio::log {

auto MemorySink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (closed_) {
    return std::unexpected(error{error_code::precondition_failed, "sink closed", "log.memory"});
  }
  bytes_.insert(bytes_.end(), bytes.begin(), bytes.end());
  return {};
}

auto MemorySink::flush(bool) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (closed_) {
    return std::unexpected(error{error_code::precondition_failed, "sink closed", "log.memory"});
  }
  return {};
}

auto MemorySink::close(bool finalize) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (finalized_) {
    return std::unexpected(error{error_code::precondition_failed, "sink finalized", "log.memory"});
  }
  closed_ = true;
  finalized_ = finalize;
  return {};
}

auto MemorySource::read(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> {
  if (pos_ >= bytes_.size()) return std::size_t{0};
  const auto avail = static_cast<std::size_t>(bytes_.size() - pos_);
  const std::size_t n = std::min(avail, out.size());
  if (n != 0) std::memcpy(out.data(), bytes_.data() + pos_, n);
  pos_ += n;
  return n;
}

auto MemorySource::seek(std::uint64_t offset) -> std::expected<void, core::error> {
  pos_ = offset;
  return {};
}

} // namespace recordio::log
