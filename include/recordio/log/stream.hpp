#pragma once

/** \file stream.hpp
 *  \brief Byte stream interfaces consumed by the record writer and reader.
 *
 * The record layer only needs an appendable sink and a seekable source; it
 * derives block alignment from their positions. Implementations decide what
 * a sync or a finalize means for their medium.
 *
 * Notes
 * - Neither interface is required to be thread-safe; one reader or writer per stream.
 * - Errors are returned via std::expected and propagated unchanged by callers.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>

#include "recordio/error.hpp"

namespace recordio::log {

/** \brief Append-only byte sink. */
class ByteSink {
public:
  virtual ~ByteSink() = default;

  /** Append all of `bytes` at the current position; partial writes are errors. */
  virtual auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> = 0;

  /** Offset the next write lands at, counted from the start of the stream. */
  virtual auto position() const -> std::uint64_t = 0;

  /** Make written bytes visible to readers; `sync` additionally asks for durability. */
  virtual auto flush(bool sync) -> std::expected<void, core::error> = 0;

  /** Release the sink. With `finalize`, the underlying stream accepts no further writes. */
  virtual auto close(bool finalize) -> std::expected<void, core::error> = 0;
};

/** \brief Readable, seekable byte source. */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /** Read up to out.size() bytes; returns the count read, 0 at end of stream. */
  virtual auto read(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> = 0;

  virtual auto position() -> std::expected<std::uint64_t, core::error> = 0;

  /** Seeking past the end is allowed; subsequent reads return 0. */
  virtual auto seek(std::uint64_t offset) -> std::expected<void, core::error> = 0;
};

} // namespace recordio::log
