#pragma once

/** \file reader.hpp
 *  \brief Record reader: reassembles logical records and recovers from corruption.
 *
 * Notes
 * - Reader is not thread-safe; one reader per source.
 * - Corruption (bad length, checksum mismatch, invalid type sequence) is never
 *   an error: the partial record is discarded, the observer is notified, and
 *   reading resumes at the next block boundary.
 * - A truncated tail (partial header or payload) is end of stream. The source
 *   is rewound to the start of the unfinished logical record, so a later call
 *   picks the record up once the writer has flushed the rest.
 * - Only source failures surface as errors.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "recordio/error.hpp"
#include "recordio/log/diagnostics.hpp"
#include "recordio/log/format.hpp"
#include "recordio/log/record_buffer.hpp"
#include "recordio/log/stream.hpp"

namespace recordio::log {

struct ReaderOptions {
  CorruptionObserver on_corruption{};  /**< empty = stderr_corruption_observer() */
  bool verify_checksums{true};         /**< false skips the CRC comparison */
  std::size_t max_record_bytes{0};     /**< 0 = unlimited; larger logical records count as corruption */
};

struct ReaderStats {
  std::uint64_t records{};            /**< logical records returned */
  std::uint64_t physical_records{};   /**< complete physical records read (valid or not) */
  std::uint64_t bytes{};              /**< logical bytes returned */
  std::uint64_t corruptions{};        /**< corruption events reported */
  std::uint64_t bytes_dropped{};      /**< payload bytes discarded by corruption handling */
  std::uint64_t resyncs{};            /**< jumps to a block boundary after corruption */
  std::array<std::uint64_t, MAX_RECORD_TYPE + 1> type_counts{}; /**< per-type histogram of checksum-valid records */
};

class RecordReader {
public:
  /** `source` must outlive the reader. Reading starts at the source's current position. */
  explicit RecordReader(ByteSource& source, ReaderOptions opts = {});

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;
  RecordReader(RecordReader&&) = default;
  RecordReader& operator=(RecordReader&&) = default;

  /** Next logical record, or std::nullopt at end of stream.
   *  The span is valid until the next read_record() or seek().
   */
  auto read_record() -> std::expected<std::optional<std::span<const std::uint8_t>>, core::error>;

  auto position() -> std::expected<std::uint64_t, core::error>;

  /** Reposition the source; any partially reassembled record is discarded. */
  auto seek(std::uint64_t offset) -> std::expected<void, core::error>;

  const ReaderStats& stats() const noexcept { return stats_; }

private:
  enum class ReadStatus : std::uint8_t { record, block_tail, end_of_stream, corrupt };

  struct PhysicalRecord {
    ReadStatus status{ReadStatus::end_of_stream};
    std::uint8_t type{0};                  // raw tag from the header
    std::uint64_t offset{0};               // stream offset of the header
    std::span<const std::uint8_t> payload;
    std::string_view reason;               // set for corrupt
    std::size_t dropped{0};                // set for corrupt
  };

  auto read_physical() -> std::expected<PhysicalRecord, core::error>;
  auto read_fully(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error>;
  auto skip_to_next_block(std::uint64_t offset) -> std::expected<void, core::error>;
  auto recover(std::uint64_t offset, std::size_t dropped, std::string_view reason)
      -> std::expected<void, core::error>;

  ByteSource* source_;
  ReaderOptions opts_;
  std::vector<std::uint8_t> block_;
  RecordBuffer record_;
  ReaderStats stats_{};
};

enum class ScanDecision : std::uint8_t { Continue, Stop };

using RecordCallback =
    std::function<std::expected<ScanDecision, core::error>(std::span<const std::uint8_t>)>;

/** Read records until end of stream or until the callback returns Stop.
 *  A callback error stops the scan and is returned as-is.
 *  Returns the reader's cumulative stats.
 */
[[nodiscard]] auto scan_records(RecordReader& reader, const RecordCallback& on_record)
    -> std::expected<ReaderStats, core::error>;

} // namespace recordio::log
