#include "recordio/log/reader.hpp"

#include <string>

#include "recordio/log/crc32c.hpp"

namespace recordio::log {

RecordReader::RecordReader(ByteSource& source, ReaderOptions opts)
  : source_(&source),
    opts_(std::move(opts)),
    block_(BLOCK_SIZE),
    record_(BLOCK_SIZE) {
  if (!opts_.on_corruption) opts_.on_corruption = stderr_corruption_observer();
}

auto RecordReader::position() -> std::expected<std::uint64_t, core::error> {
  return source_->position();
}

auto RecordReader::seek(std::uint64_t offset) -> std::expected<void, core::error> {
  record_.clear();
  return source_->seek(offset);
}

// Short count only at end of stream.
auto RecordReader::read_fully(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> {
  std::size_t got = 0;
  while (got < out.size()) {
    auto n = source_->read(out.subspan(got));
    if (!n) return std::unexpected(n.error());
    if (*n == 0) break;
    got += *n;
  }
  return got;
}

auto RecordReader::skip_to_next_block(std::uint64_t offset) -> std::expected<void, core::error> {
  return source_->seek(next_block_boundary(offset));
}

auto RecordReader::recover(std::uint64_t offset, std::size_t dropped, std::string_view reason)
    -> std::expected<void, core::error> {
  stats_.corruptions++;
  stats_.bytes_dropped += dropped;
  opts_.on_corruption(CorruptionEvent{offset, dropped, reason});
  record_.clear();
  stats_.resyncs++;
  if (log_level() == LogLevel::debug) {
    debug_trace("reader", "resync to offset " + std::to_string(next_block_boundary(offset)));
  }
  return skip_to_next_block(offset);
}

auto RecordReader::read_physical() -> std::expected<PhysicalRecord, core::error> {
  PhysicalRecord p{};
  auto pos = source_->position();
  if (!pos) return std::unexpected(pos.error());
  p.offset = *pos;

  const std::size_t to_block_end = bytes_to_block_end(p.offset);
  if (to_block_end < HEADER_LENGTH) {
    p.status = ReadStatus::block_tail;
    return p;
  }

  HeaderBytes hb{};
  auto got = read_fully(hb);
  if (!got) return std::unexpected(got.error());
  if (*got != HEADER_LENGTH) return p; // torn header -> end of stream

  const RecordHeader h = decode_header(hb);
  p.type = h.type;
  const std::size_t room = to_block_end - HEADER_LENGTH;
  if (h.length > room) {
    p.status = ReadStatus::corrupt;
    p.reason = "bad record length";
    p.dropped = room;
    return p;
  }

  const std::span<std::uint8_t> payload{block_.data(), h.length};
  got = read_fully(payload);
  if (!got) return std::unexpected(got.error());
  if (*got != h.length) return p; // torn payload -> end of stream

  stats_.physical_records++;
  p.payload = payload;
  if (opts_.verify_checksums && unmask_crc(h.masked_crc) != record_crc(h.type, payload)) {
    p.status = ReadStatus::corrupt;
    p.reason = "checksum mismatch";
    p.dropped = payload.size();
    return p;
  }
  if (h.type <= MAX_RECORD_TYPE) stats_.type_counts[h.type]++;
  p.status = ReadStatus::record;
  return p;
}

auto RecordReader::read_record()
    -> std::expected<std::optional<std::span<const std::uint8_t>>, core::error> {
  using Result = std::optional<std::span<const std::uint8_t>>;
  record_.clear();
  RecordType last_read = RecordType::none;
  std::uint64_t logical_start = 0;

  while (true) {
    auto rec = read_physical();
    if (!rec) return std::unexpected(rec.error());
    const PhysicalRecord& p = *rec;

    // Discards the partial logical record and resumes at the next block.
    auto corrupt = [&](std::string_view reason, std::size_t dropped) -> std::expected<void, core::error> {
      const std::size_t total = record_.size() + dropped;
      last_read = RecordType::none;
      return recover(p.offset, total, reason);
    };
    auto exceeds_limit = [&](std::size_t more) {
      return opts_.max_record_bytes != 0 && record_.size() + more > opts_.max_record_bytes;
    };

    switch (p.status) {
      case ReadStatus::end_of_stream: {
        const std::uint64_t rewind = (last_read == RecordType::none) ? p.offset : logical_start;
        record_.clear();
        if (auto r = source_->seek(rewind); !r) return std::unexpected(r.error());
        return Result{std::nullopt};
      }
      case ReadStatus::block_tail:
        if (auto r = skip_to_next_block(p.offset); !r) return std::unexpected(r.error());
        continue;
      case ReadStatus::corrupt:
        if (auto r = corrupt(p.reason, p.dropped); !r) return std::unexpected(r.error());
        continue;
      case ReadStatus::record:
        break;
    }

    if (!is_known_type(p.type)) {
      const std::string reason = "unknown record type " + std::to_string(p.type);
      if (auto r = corrupt(reason, p.payload.size()); !r) return std::unexpected(r.error());
      continue;
    }

    switch (static_cast<RecordType>(p.type)) {
      case RecordType::none:
        // A stored NONE carries no data; treat it like a block tail.
        if (auto r = skip_to_next_block(p.offset); !r) return std::unexpected(r.error());
        continue;

      case RecordType::full:
        if (last_read != RecordType::none) {
          if (auto r = corrupt("FULL record inside fragmented record", p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        if (exceeds_limit(p.payload.size())) {
          if (auto r = corrupt("record exceeds max_record_bytes", p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        stats_.records++;
        stats_.bytes += p.payload.size();
        return Result{p.payload};

      case RecordType::first:
        if (last_read != RecordType::none) {
          if (auto r = corrupt("FIRST record inside fragmented record", p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        if (exceeds_limit(p.payload.size())) {
          if (auto r = corrupt("record exceeds max_record_bytes", p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        logical_start = p.offset;
        record_.append(p.payload);
        last_read = RecordType::first;
        continue;

      case RecordType::middle:
      case RecordType::last: {
        const bool is_last = static_cast<RecordType>(p.type) == RecordType::last;
        if (last_read == RecordType::none) {
          if (auto r = corrupt(is_last ? "LAST record without FIRST" : "MIDDLE record without FIRST",
                               p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        if (exceeds_limit(p.payload.size())) {
          if (auto r = corrupt("record exceeds max_record_bytes", p.payload.size()); !r) {
            return std::unexpected(r.error());
          }
          continue;
        }
        record_.append(p.payload);
        if (!is_last) {
          last_read = RecordType::middle;
          continue;
        }
        stats_.records++;
        stats_.bytes += record_.size();
        return Result{record_.view()};
      }
    }
  }
}

auto scan_records(RecordReader& reader, const RecordCallback& on_record)
    -> std::expected<ReaderStats, core::error> {
  while (true) {
    auto rec = reader.read_record();
    if (!rec) return std::unexpected(rec.error());
    if (!rec->has_value()) break;
    auto decision = on_record(**rec);
    if (!decision) return std::unexpected(decision.error());
    if (*decision == ScanDecision::Stop) break;
  }
  return reader.stats();
}

} // namespace recordio::log
