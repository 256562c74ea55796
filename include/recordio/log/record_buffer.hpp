#pragma once

/** \file record_buffer.hpp
 *  \brief Growable byte buffer used to reassemble fragmented records.
 *
 * Capacity starts at the given size (one block by default) and doubles until
 * an append fits, keeping the bytes already accumulated. clear() keeps the
 * capacity so steady-state reassembly does not allocate.
 *
 * Thread-safety: NOT thread-safe. Caller must ensure exclusive access.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <utility>

#include "recordio/log/format.hpp"

namespace recordio::log {

class RecordBuffer {
public:
  explicit RecordBuffer(std::size_t initial_capacity = BLOCK_SIZE);

  RecordBuffer(RecordBuffer&& o) noexcept
    : data_(std::move(o.data_)),
      size_(std::exchange(o.size_, 0)),
      capacity_(std::exchange(o.capacity_, 0)) {}
  RecordBuffer& operator=(RecordBuffer&& o) noexcept {
    if (this != &o) {
      data_ = std::move(o.data_);
      size_ = std::exchange(o.size_, 0);
      capacity_ = std::exchange(o.capacity_, 0);
    }
    return *this;
  }
  RecordBuffer(const RecordBuffer&) = delete;
  RecordBuffer& operator=(const RecordBuffer&) = delete;

  /** \throws std::bad_alloc if growth fails */
  void append(std::span<const std::uint8_t> bytes);
  void clear() noexcept { size_ = 0; }

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] std::span<const std::uint8_t> view() const noexcept { return {data_.get(), size_}; }

private:
  std::unique_ptr<std::uint8_t[]> data_;
  std::size_t size_{0};
  std::size_t capacity_{0};
};

} // namespace recordio::log
