#include <catch2/catch_all.hpp>
#include <recordio/log/memory_stream.hpp>
#include <recordio/log/reader.hpp>
#include <recordio/log/writer.hpp>

#include <random>
#include <string>
#include <vector>

#include <tests/support/log_test_helpers.hpp>

using namespace recordio;
using namespace test_support;
using recordio::core::error_code;

namespace {

constexpr std::uint8_t NONE = 0, FULL = 1, FIRST = 2, MIDDLE = 3, LAST = 4;

class FailingSource final : public log::ByteSource {
public:
  auto read(std::span<std::uint8_t>) -> std::expected<std::size_t, core::error> override {
    return std::unexpected(core::error{error_code::io_failed, "read failed", "test.source"});
  }
  auto position() -> std::expected<std::uint64_t, core::error> override { return 0; }
  auto seek(std::uint64_t) -> std::expected<void, core::error> override { return {}; }
};

log::ReaderOptions collecting(std::vector<CollectedCorruption>& events) {
  log::ReaderOptions opts;
  opts.on_corruption = collect_into(events);
  return opts;
}

} // namespace

TEST_CASE("records of every size class round-trip", "[log][reader]") {
  const std::vector<std::size_t> sizes{0, 1, 32761, 32762, 100000, 7, 196608};
  log::MemorySink sink;
  log::RecordWriter w(sink);
  std::vector<std::vector<std::uint8_t>> written;
  for (std::size_t i = 0; i < sizes.size(); ++i) {
    written.push_back(pattern(sizes[i], static_cast<std::uint8_t>(i)));
    auto n = w.write(std::span<const std::uint8_t>{written.back()});
    REQUIRE(n.has_value());
    REQUIRE(*n == sizes[i]);
  }

  std::vector<CollectedCorruption> events;
  log::MemorySource src(sink.bytes());
  log::RecordReader r(src, collecting(events));
  for (const auto& expected : written) {
    auto rec = r.read_record();
    REQUIRE(rec.has_value());
    REQUIRE(rec->has_value());
    REQUIRE(std::vector<std::uint8_t>((*rec)->begin(), (*rec)->end()) == expected);
  }
  auto end = r.read_record();
  REQUIRE(end.has_value());
  REQUIRE_FALSE(end->has_value());
  REQUIRE(events.empty());
  REQUIRE(r.stats().records == sizes.size());
}

TEST_CASE("mixed records read back in order", "[log][reader]") {
  const std::vector<std::string> records{"hello", std::string(40000, 'a'), ""};
  auto stream = write_stream(records);
  REQUIRE(physical_records(stream).size() == 4);

  log::MemorySource src(stream);
  std::vector<CollectedCorruption> events;
  log::RecordReader r(src, collecting(events));
  std::vector<std::string> out;
  while (true) {
    auto rec = r.read_record();
    REQUIRE(rec.has_value());
    if (!rec->has_value()) break;
    out.push_back(string_of(**rec));
  }
  REQUIRE(out == records);
  REQUIRE(events.empty());

  const auto& s = r.stats();
  REQUIRE(s.records == 3);
  REQUIRE(s.physical_records == 4);
  REQUIRE(s.bytes == 40005);
  REQUIRE(s.corruptions == 0);
  REQUIRE(s.type_counts[FULL] == 2);
  REQUIRE(s.type_counts[FIRST] == 1);
  REQUIRE(s.type_counts[MIDDLE] == 0);
  REQUIRE(s.type_counts[LAST] == 1);
}

TEST_CASE("random record sizes round-trip", "[log][reader]") {
  std::mt19937 rng(1234);
  std::uniform_int_distribution<std::size_t> size_dist(0, 3 * log::BLOCK_SIZE);
  std::vector<std::string> records;
  for (int i = 0; i < 60; ++i) {
    const auto bytes = pattern(size_dist(rng), static_cast<std::uint8_t>(i));
    records.push_back(string_of(bytes));
  }
  REQUIRE(read_all(write_stream(records)) == records);
}

TEST_CASE("checksum mismatch drops the record and resyncs at the next block", "[log][reader][corruption]") {
  auto stream = write_stream({std::string(log::BLOCK_SIZE - log::HEADER_LENGTH, 'x'), "next"});
  stream[100] ^= 0xFF;

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"next"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 0);
  REQUIRE(events[0].bytes_dropped == log::BLOCK_SIZE - log::HEADER_LENGTH);
  REQUIRE(events[0].reason == "checksum mismatch");

  SECTION("verification can be disabled") {
    log::ReaderOptions opts;
    opts.verify_checksums = false;
    std::vector<CollectedCorruption> none;
    auto out = read_all(stream, &none, opts);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].size() == log::BLOCK_SIZE - log::HEADER_LENGTH);
    REQUIRE(static_cast<std::uint8_t>(out[0][100 - log::HEADER_LENGTH]) == static_cast<std::uint8_t>('x' ^ 0xFF));
    REQUIRE(out[1] == "next");
    REQUIRE(none.empty());
  }
}

TEST_CASE("corruption drops the rest of its block", "[log][reader][corruption]") {
  // alpha@0, beta@12, gamma@23, filler@35 ends exactly at the block boundary, delta@32768.
  const std::string filler(log::BLOCK_SIZE - 35 - log::HEADER_LENGTH, 'f');
  auto stream = write_stream({"alpha", "beta", "gamma", filler, "delta"});
  REQUIRE(physical_records(stream).back().offset == log::BLOCK_SIZE);
  stream[19] ^= 0x01; // first payload byte of "beta"

  std::vector<CollectedCorruption> events;
  log::MemorySource src(stream);
  log::RecordReader r(src, collecting(events));
  std::vector<std::string> out;
  while (true) {
    auto rec = r.read_record();
    REQUIRE(rec.has_value());
    if (!rec->has_value()) break;
    out.push_back(string_of(**rec));
  }
  REQUIRE(out == std::vector<std::string>{"alpha", "delta"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 12);
  REQUIRE(events[0].bytes_dropped == 4);
  REQUIRE(r.stats().corruptions == 1);
  REQUIRE(r.stats().resyncs == 1);
  REQUIRE(r.stats().bytes_dropped == 4);
}

TEST_CASE("truncated tail is end of stream, not corruption", "[log][reader][tail]") {
  std::vector<CollectedCorruption> events;

  SECTION("torn payload") {
    auto stream = write_stream({"hello", "world"});
    stream.resize(20);
    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    auto first = r.read_record();
    REQUIRE(first.has_value());
    REQUIRE(string_of(**first) == "hello");
    auto end = r.read_record();
    REQUIRE(end.has_value());
    REQUIRE_FALSE(end->has_value());
    REQUIRE(*r.position() == 12);
  }

  SECTION("torn header") {
    auto stream = write_stream({"hello", "world"});
    stream.resize(15);
    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    REQUIRE(r.read_record()->has_value());
    auto end = r.read_record();
    REQUIRE(end.has_value());
    REQUIRE_FALSE(end->has_value());
    REQUIRE(*r.position() == 12);
  }

  SECTION("torn fragment rewinds to the start of the logical record") {
    const std::string big(40000, 'b');
    const auto full = write_stream({"abc", big});
    auto stream = full;
    stream.resize(log::BLOCK_SIZE + 3);

    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    REQUIRE(string_of(**r.read_record()) == "abc");
    auto end = r.read_record();
    REQUIRE(end.has_value());
    REQUIRE_FALSE(end->has_value());
    REQUIRE(*r.position() == 10);

    // Asking again gives the same answer.
    REQUIRE_FALSE(r.read_record()->has_value());
    REQUIRE(*r.position() == 10);

    // Once the rest is available the record reads in full from there.
    log::MemorySource grown(full);
    log::RecordReader r2(grown, collecting(events));
    REQUIRE(r2.seek(10).has_value());
    auto rec = r2.read_record();
    REQUIRE(rec.has_value());
    REQUIRE(rec->has_value());
    REQUIRE(string_of(**rec) == big);
  }

  REQUIRE(events.empty());
}

TEST_CASE("fragment without FIRST is corruption", "[log][reader][corruption]") {
  std::vector<std::uint8_t> stream;
  append_physical(stream, MIDDLE, "orphan");
  pad_to_block(stream);
  append_physical(stream, FULL, "valid");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"valid"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 0);
  REQUIRE(events[0].bytes_dropped == 6);
  REQUIRE(events[0].reason == "MIDDLE record without FIRST");

  std::vector<std::uint8_t> last_only;
  append_physical(last_only, LAST, "tail");
  events.clear();
  REQUIRE(read_all(last_only, &events).empty());
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].reason == "LAST record without FIRST");
}

TEST_CASE("FULL inside a fragmented record drops both", "[log][reader][corruption]") {
  std::vector<std::uint8_t> stream;
  append_physical(stream, FIRST, "a");
  append_physical(stream, FULL, "b");
  pad_to_block(stream);
  append_physical(stream, FULL, "c");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"c"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 8);
  REQUIRE(events[0].bytes_dropped == 2);
}

TEST_CASE("FIRST inside a fragmented record is corruption", "[log][reader][corruption]") {
  std::vector<std::uint8_t> stream;
  append_physical(stream, FIRST, "one");
  append_physical(stream, FIRST, "two");
  pad_to_block(stream);
  append_physical(stream, FULL, "three");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"three"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 10);
  REQUIRE(events[0].bytes_dropped == 6);
}

TEST_CASE("unknown record type is corruption", "[log][reader][corruption]") {
  std::vector<std::uint8_t> stream;
  append_physical(stream, 9, "zzz");
  pad_to_block(stream);
  append_physical(stream, FULL, "ok");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"ok"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].reason == "unknown record type 9");
  REQUIRE(events[0].bytes_dropped == 3);
}

TEST_CASE("length past the block end is corruption", "[log][reader][corruption]") {
  const auto hb = log::encode_header(log::RecordHeader{0, 40000, FULL});
  std::vector<std::uint8_t> stream(hb.begin(), hb.end());
  pad_to_block(stream);
  append_physical(stream, FULL, "ok");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"ok"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 0);
  REQUIRE(events[0].reason == "bad record length");
  REQUIRE(events[0].bytes_dropped == log::BLOCK_SIZE - log::HEADER_LENGTH);
}

TEST_CASE("stored NONE record skips the rest of its block silently", "[log][reader]") {
  std::vector<std::uint8_t> stream;
  append_physical(stream, FULL, "a");
  append_physical(stream, NONE, "");
  append_physical(stream, FULL, "hidden");
  pad_to_block(stream);
  append_physical(stream, FULL, "b");

  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events) == std::vector<std::string>{"a", "b"});
  REQUIRE(events.empty());
}

TEST_CASE("max_record_bytes bounds reassembly", "[log][reader][safety]") {
  // "ok"@0 ends at 9; the big record fills the rest of block 0.
  const std::string big(log::BLOCK_SIZE - 9 - log::HEADER_LENGTH, 'B');
  auto stream = write_stream({"ok", big, "after"});

  log::ReaderOptions opts;
  opts.max_record_bytes = 1000;
  std::vector<CollectedCorruption> events;
  REQUIRE(read_all(stream, &events, opts) == std::vector<std::string>{"ok", "after"});
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].offset == 9);
  REQUIRE(events[0].bytes_dropped == big.size());
  REQUIRE(events[0].reason == "record exceeds max_record_bytes");

  SECTION("fragmented records are bounded too") {
    // FIRST fills block 0, LAST fills block 1, "z" starts block 2.
    const std::size_t two_blocks = 2 * (log::BLOCK_SIZE - log::HEADER_LENGTH);
    auto frag = write_stream({std::string(two_blocks, 'F'), "z"});
    events.clear();
    log::ReaderOptions small;
    small.max_record_bytes = 40000;
    REQUIRE(read_all(frag, &events, small) == std::vector<std::string>{"z"});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].offset == log::BLOCK_SIZE);
    REQUIRE(events[0].bytes_dropped == two_blocks);
  }
}

TEST_CASE("seek positions the reader at a block boundary", "[log][reader]") {
  auto stream = write_stream({std::string(log::BLOCK_SIZE - log::HEADER_LENGTH, 'x'), "next"});
  log::MemorySource src(stream);
  std::vector<CollectedCorruption> events;
  log::RecordReader r(src, collecting(events));
  REQUIRE(r.seek(log::BLOCK_SIZE).has_value());
  auto rec = r.read_record();
  REQUIRE(rec.has_value());
  REQUIRE(string_of(**rec) == "next");
  REQUIRE_FALSE(r.read_record()->has_value());
  REQUIRE(*r.position() == stream.size());
}

TEST_CASE("source errors propagate", "[log][reader][errors]") {
  FailingSource src;
  std::vector<CollectedCorruption> events;
  log::RecordReader r(src, collecting(events));
  auto rec = r.read_record();
  REQUIRE_FALSE(rec.has_value());
  REQUIRE(rec.error().code == error_code::io_failed);
  REQUIRE(rec.error().component == "test.source");
}

TEST_CASE("scan_records honors Stop and callback errors", "[log][reader][scan]") {
  auto stream = write_stream({"a", "b", "c"});
  std::vector<CollectedCorruption> events;

  SECTION("stop") {
    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    std::vector<std::string> seen;
    auto st = log::scan_records(r, [&](std::span<const std::uint8_t> rec)
        -> std::expected<log::ScanDecision, core::error> {
      seen.push_back(string_of(rec));
      return seen.size() == 2 ? log::ScanDecision::Stop : log::ScanDecision::Continue;
    });
    REQUIRE(st.has_value());
    REQUIRE(seen == std::vector<std::string>{"a", "b"});
    REQUIRE(st->records == 2);
  }

  SECTION("run to end") {
    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    std::size_t n = 0;
    auto st = log::scan_records(r, [&](std::span<const std::uint8_t>)
        -> std::expected<log::ScanDecision, core::error> {
      ++n;
      return log::ScanDecision::Continue;
    });
    REQUIRE(st.has_value());
    REQUIRE(n == 3);
    REQUIRE(st->records == 3);
  }

  SECTION("callback error") {
    log::MemorySource src(stream);
    log::RecordReader r(src, collecting(events));
    auto st = log::scan_records(r, [](std::span<const std::uint8_t>)
        -> std::expected<log::ScanDecision, core::error> {
      return std::unexpected(core::error{error_code::internal, "boom", "test.scan"});
    });
    REQUIRE_FALSE(st.has_value());
    REQUIRE(st.error().message == "boom");
  }
}
