#include "recordio/log/file_stream.hpp"

#include <system_error>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

// OS-level sync of a file's contents through a separate handle.
static auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, recordio::core::error> {
  using recordio::core::error; using recordio::core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "log.file"});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed", "log.file"});
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "log.file"});
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) {
    return std::unexpected(error{error_code::io_failed, "FlushFileBuffers failed", "log.file"});
  }
#endif
  return {};
}

namespace recordio::log {

FileSink::~FileSink() { if (out_.is_open()) out_.close(); }

auto FileSink::open(const std::filesystem::path& path, bool create_if_missing)
    -> std::expected<FileSink, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (!exists && !create_if_missing) {
    return std::unexpected(error{error_code::not_found, "log file missing", "log.file"});
  }
  FileSink s;
  s.path_ = path;
  s.out_.open(path, std::ios::binary | std::ios::out | std::ios::app);
  if (!s.out_.good()) {
    return std::unexpected(error{error_code::io_failed, "open failed", "log.file"});
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "stat failed", "log.file"});
  }
  s.pos_ = size;
  return s;
}

auto FileSink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) {
    return std::unexpected(error{error_code::precondition_failed,
                                 finalized_ ? "sink finalized" : "sink closed", "log.file"});
  }
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "write failed", "log.file"});
  pos_ += bytes.size();
  return {};
}

auto FileSink::flush(bool sync) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open()) {
    return std::unexpected(error{error_code::precondition_failed, "sink closed", "log.file"});
  }
  out_.flush();
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "flush failed", "log.file"});
  if (sync) {
    if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
    syncs_++;
  }
  return {};
}

auto FileSink::close(bool finalize) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (finalized_) {
    return std::unexpected(error{error_code::precondition_failed, "sink finalized", "log.file"});
  }
  if (out_.is_open()) {
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!ok) return std::unexpected(error{error_code::io_failed, "flush on close failed", "log.file"});
  }
  finalized_ = finalize;
  return {};
}

auto FileSource::open(const std::filesystem::path& path) -> std::expected<FileSource, core::error> {
  using core::error; using core::error_code;
  FileSource s;
  s.path_ = path;
  s.in_.open(path, std::ios::binary | std::ios::in);
  if (!s.in_.good()) return std::unexpected(error{error_code::not_found, "open failed", "log.file"});
  return s;
}

auto FileSource::read(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (out.empty()) return std::size_t{0};
  in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  const auto n = static_cast<std::size_t>(in_.gcount());
  if (in_.bad()) return std::unexpected(error{error_code::io_failed, "read failed", "log.file"});
  // A short read leaves eof|fail set; clear so position() and seek() keep working.
  if (!in_.good()) in_.clear();
  return n;
}

auto FileSource::position() -> std::expected<std::uint64_t, core::error> {
  using core::error; using core::error_code;
  const auto pos = in_.tellg();
  if (pos == std::streampos(-1)) return std::unexpected(error{error_code::io_failed, "tell failed", "log.file"});
  return static_cast<std::uint64_t>(pos);
}

auto FileSource::seek(std::uint64_t offset) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (in_.fail()) return std::unexpected(error{error_code::io_failed, "seek failed", "log.file"});
  return {};
}

} // namespace recordio::log
