#include "recordio/log/record_buffer.hpp"

#include <cstring>
#include <limits>
#include <new>

namespace recordio::log {

RecordBuffer::RecordBuffer(std::size_t initial_capacity)
  : data_(std::make_unique_for_overwrite<std::uint8_t[]>(initial_capacity == 0 ? 1 : initial_capacity)),
    capacity_(initial_capacity == 0 ? 1 : initial_capacity) {}

void RecordBuffer::append(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) return;
  if (capacity_ - size_ < bytes.size()) {
    if (bytes.size() > std::numeric_limits<std::size_t>::max() - size_) throw std::bad_alloc();
    const std::size_t needed = size_ + bytes.size();
    std::size_t cap = capacity_ == 0 ? BLOCK_SIZE : capacity_;
    while (cap < needed) {
      if (cap > std::numeric_limits<std::size_t>::max() / 2) { cap = needed; break; }
      cap *= 2;
    }
    auto grown = std::make_unique_for_overwrite<std::uint8_t[]>(cap);
    if (size_ != 0) std::memcpy(grown.get(), data_.get(), size_);
    data_ = std::move(grown);
    capacity_ = cap;
  }
  std::memcpy(data_.get() + size_, bytes.data(), bytes.size());
  size_ += bytes.size();
}

} // namespace recordio::log
