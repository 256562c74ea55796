/**
 * Record log example using recordio
 *
 * This example demonstrates:
 * - Appending records to a log file
 * - Reopening the log and appending more
 * - Reading records back and inspecting reader stats
 */

#include <recordio/recordio.hpp>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace recordio;
    namespace fs = std::filesystem;

    const fs::path path = argc > 1 ? fs::path(argv[1]) : fs::temp_directory_path() / "recordio_example.log";
    std::error_code ec;
    fs::remove(path, ec);

    // First session: a few small records and one spanning several blocks
    {
        auto sink = log::FileSink::open(path);
        if (!sink) {
            std::cerr << "open failed: " << sink.error().message << "\n";
            return 1;
        }
        log::RecordWriter writer(*sink);
        const std::vector<std::string> records{"hello", "record", std::string(100000, 'x')};
        for (const auto& rec : records) {
            if (auto r = writer.write(rec); !r) {
                std::cerr << "write failed: " << r.error().message << "\n";
                return 1;
            }
        }
        if (auto r = writer.close(); !r) {
            std::cerr << "close failed: " << r.error().message << "\n";
            return 1;
        }
        std::cout << "wrote " << writer.stats().records << " records in "
                  << writer.stats().physical_records << " physical records\n";
    }

    // Second session continues the block layout and finalizes
    {
        auto sink = log::FileSink::open(path, /*create_if_missing=*/false);
        if (!sink) {
            std::cerr << "reopen failed: " << sink.error().message << "\n";
            return 1;
        }
        log::RecordWriter writer(*sink);
        if (auto r = writer.write(std::string_view{"goodbye"}); !r) {
            std::cerr << "write failed: " << r.error().message << "\n";
            return 1;
        }
        if (auto r = writer.close_finally(); !r) {
            std::cerr << "finalize failed: " << r.error().message << "\n";
            return 1;
        }
    }

    auto source = log::FileSource::open(path);
    if (!source) {
        std::cerr << "open for read failed: " << source.error().message << "\n";
        return 1;
    }
    log::RecordReader reader(*source);
    auto stats = log::scan_records(reader, [](std::span<const std::uint8_t> rec)
            -> std::expected<log::ScanDecision, core::error> {
        std::cout << "record of " << rec.size() << " bytes\n";
        return log::ScanDecision::Continue;
    });
    if (!stats) {
        std::cerr << "scan failed: " << core::to_string(stats.error().code) << "\n";
        return 1;
    }
    std::cout << stats->records << " records, " << stats->corruptions << " corruptions\n";
    return 0;
}
