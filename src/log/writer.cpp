#include "recordio/log/writer.hpp"

#include <algorithm>
#include <limits>

#include "recordio/log/crc32c.hpp"

namespace recordio::log {

RecordWriter::RecordWriter(ByteSink& sink, WriterOptions opts)
  : sink_(&sink), opts_(opts) {
  scratch_.reserve(BLOCK_SIZE);
}

auto RecordWriter::check_open() const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  switch (state_) {
    case State::open: return {};
    case State::closed:
      return std::unexpected(error{error_code::precondition_failed, "writer closed", "log.writer"});
    case State::finalized:
      return std::unexpected(error{error_code::precondition_failed, "writer finalized", "log.writer"});
  }
  return std::unexpected(error{error_code::internal, "bad writer state", "log.writer"});
}

void RecordWriter::emit_physical(RecordType type, std::span<const std::uint8_t> chunk) {
  const auto tag = static_cast<std::uint8_t>(type);
  const RecordHeader h{mask_crc(record_crc(tag, chunk)), static_cast<std::uint16_t>(chunk.size()), tag};
  const auto hdr = encode_header(h);
  scratch_.insert(scratch_.end(), hdr.begin(), hdr.end());
  scratch_.insert(scratch_.end(), chunk.begin(), chunk.end());
  stats_.physical_records++;
}

// Appends the framed form of `record` to scratch_, as if the stream were at `start`.
void RecordWriter::frame_record(std::span<const std::uint8_t> record, std::uint64_t start) {
  std::uint64_t pos = start;
  std::size_t left = record.size();
  const std::uint8_t* ptr = record.data();
  bool begin = true;
  do {
    const std::size_t leftover = bytes_to_block_end(pos);
    if (leftover < HEADER_LENGTH) {
      scratch_.insert(scratch_.end(), leftover, std::uint8_t{0});
      stats_.padding_bytes += leftover;
      pos += leftover;
      continue;
    }
    const std::size_t avail = leftover - HEADER_LENGTH;
    const std::size_t fragment = std::min(left, avail);
    const bool end = (fragment == left);
    RecordType type;
    if (begin && end) type = RecordType::full;
    else if (begin) type = RecordType::first;
    else if (end) type = RecordType::last;
    else type = RecordType::middle;

    emit_physical(type, {ptr, fragment});
    ptr += fragment;
    left -= fragment;
    pos += HEADER_LENGTH + fragment;
    begin = false;
  } while (left > 0 || begin);
}

auto RecordWriter::write(std::span<const std::uint8_t> record, std::optional<std::string_view> sequence_key)
    -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  // Framing adds under 0.1% overhead; this bound keeps the framed size representable.
  if (record.size() > std::numeric_limits<std::size_t>::max() / 2) {
    return std::unexpected(error{error_code::invalid_argument, "record too large", "log.writer"});
  }
  if (sequence_key && opts_.strict_sequence_keys && last_key_ && *sequence_key <= *last_key_) {
    return std::unexpected(error{error_code::precondition_failed, "sequence key out of order", "log.writer"});
  }

  scratch_.clear();
  const auto before = stats_;
  frame_record(record, sink_->position());
  if (auto w = sink_->write(scratch_); !w) {
    stats_ = before;
    return std::unexpected(w.error());
  }
  stats_.records++;
  stats_.payload_bytes += record.size();
  stats_.bytes += scratch_.size();
  if (sequence_key) last_key_ = std::string(*sequence_key);
  // Keep one block of scratch; a huge record should not pin its buffer.
  if (scratch_.capacity() > 4 * BLOCK_SIZE) {
    scratch_ = std::vector<std::uint8_t>();
    scratch_.reserve(BLOCK_SIZE);
  }
  return record.size();
}

auto RecordWriter::write(std::string_view record, std::optional<std::string_view> sequence_key)
    -> std::expected<std::size_t, core::error> {
  return write(std::span<const std::uint8_t>{reinterpret_cast<const std::uint8_t*>(record.data()), record.size()},
               sequence_key);
}

auto RecordWriter::flush(bool sync) -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  const bool do_sync = sync || opts_.sync_on_flush;
  if (auto r = sink_->flush(do_sync); !r) return std::unexpected(r.error());
  stats_.flushes++;
  if (do_sync) stats_.syncs++;
  return {};
}

auto RecordWriter::close() -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (auto r = sink_->close(/*finalize=*/false); !r) return std::unexpected(r.error());
  state_ = State::closed;
  return {};
}

auto RecordWriter::close_finally() -> std::expected<void, core::error> {
  if (auto ok = check_open(); !ok) return std::unexpected(ok.error());
  if (auto r = sink_->flush(opts_.sync_on_finalize); !r) return std::unexpected(r.error());
  stats_.flushes++;
  if (opts_.sync_on_finalize) stats_.syncs++;
  if (auto r = sink_->close(/*finalize=*/true); !r) return std::unexpected(r.error());
  state_ = State::finalized;
  return {};
}

} // namespace recordio::log
