#pragma once

/** \file writer.hpp
 *  \brief Record writer: fragments logical records into block-aligned physical records.
 *
 * Notes
 * - Writer is not thread-safe; one writer per sink.
 * - All physical records of one logical record reach the sink in a single write.
 * - Block alignment is derived from the sink position, so a writer opened on a
 *   non-empty sink continues the existing block layout.
 * - Sink errors are returned unchanged. After a failed write the stream content
 *   is indeterminate; start a fresh log.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "recordio/error.hpp"
#include "recordio/log/format.hpp"
#include "recordio/log/stream.hpp"

namespace recordio::log {

struct WriterOptions {
  bool strict_sequence_keys{true};  /**< reject keys not strictly greater than the last accepted key */
  bool sync_on_flush{false};        /**< every flush() also syncs */
  bool sync_on_finalize{true};      /**< close_finally() syncs before closing the sink */
};

struct WriterStats {
  std::uint64_t records{};          /**< logical records written */
  std::uint64_t physical_records{};
  std::uint64_t payload_bytes{};    /**< logical record bytes */
  std::uint64_t padding_bytes{};    /**< zero bytes filling block tails */
  std::uint64_t bytes{};            /**< everything handed to the sink */
  std::uint64_t flushes{};
  std::uint64_t syncs{};
};

class RecordWriter {
public:
  /** `sink` must outlive the writer. */
  explicit RecordWriter(ByteSink& sink, WriterOptions opts = {});

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  /** Append one logical record; returns record.size() on success.
   *  `sequence_key` is upstream bookkeeping only and never reaches the stream.
   */
  auto write(std::span<const std::uint8_t> record,
             std::optional<std::string_view> sequence_key = std::nullopt)
      -> std::expected<std::size_t, core::error>;

  auto write(std::string_view record, std::optional<std::string_view> sequence_key = std::nullopt)
      -> std::expected<std::size_t, core::error>;

  /** Flush the sink. If sync=true or options.sync_on_flush, requests OS-level durability. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Release the sink without finalizing it; the stream may be reopened by another writer. */
  auto close() -> std::expected<void, core::error>;

  /** Finalize the stream; any further operation on this writer fails. */
  auto close_finally() -> std::expected<void, core::error>;

  std::uint64_t position() const { return sink_->position(); }
  bool is_open() const noexcept { return state_ == State::open; }
  bool is_finalized() const noexcept { return state_ == State::finalized; }
  const std::optional<std::string>& last_sequence_key() const noexcept { return last_key_; }
  const WriterStats& stats() const noexcept { return stats_; }

private:
  enum class State : std::uint8_t { open, closed, finalized };

  auto check_open() const -> std::expected<void, core::error>;
  void frame_record(std::span<const std::uint8_t> record, std::uint64_t start);
  void emit_physical(RecordType type, std::span<const std::uint8_t> chunk);

  ByteSink* sink_;
  WriterOptions opts_;
  State state_{State::open};
  std::optional<std::string> last_key_;
  std::vector<std::uint8_t> scratch_;
  WriterStats stats_{};
};

} // namespace recordio::log
