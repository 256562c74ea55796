#pragma once

/** \file file_stream.hpp
 *  \brief File-backed ByteSink (binary append) and ByteSource (binary read).
 *
 * Notes
 * - FileSink opens in append mode; its position starts at the existing file
 *   size, so a RecordWriter on an existing log keeps block alignment.
 * - flush(true) performs an OS-level sync (fsync/FlushFileBuffers).
 * - Finalization is tracked per sink instance; nothing is persisted about it.
 */

#include <cstdint>
#include <filesystem>
#include <fstream>

#include "recordio/log/stream.hpp"

namespace recordio::log {

class FileSink final : public ByteSink {
public:
  FileSink(FileSink&&) = default;
  FileSink& operator=(FileSink&&) = default;
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;
  ~FileSink() override;

  static auto open(const std::filesystem::path& path, bool create_if_missing = true)
      -> std::expected<FileSink, core::error>;

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;
  auto position() const -> std::uint64_t override { return pos_; }
  auto flush(bool sync) -> std::expected<void, core::error> override;
  auto close(bool finalize) -> std::expected<void, core::error> override;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t syncs() const noexcept { return syncs_; }

private:
  FileSink() = default;

  std::filesystem::path path_;
  std::ofstream out_;
  std::uint64_t pos_{};
  std::uint64_t syncs_{};
  bool finalized_{false};
};

class FileSource final : public ByteSource {
public:
  FileSource(FileSource&&) = default;
  FileSource& operator=(FileSource&&) = default;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;
  ~FileSource() override = default;

  static auto open(const std::filesystem::path& path) -> std::expected<FileSource, core::error>;

  auto read(std::span<std::uint8_t> out) -> std::expected<std::size_t, core::error> override;
  auto position() -> std::expected<std::uint64_t, core::error> override;
  auto seek(std::uint64_t offset) -> std::expected<void, core::error> override;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  FileSource() = default;

  std::filesystem::path path_;
  std::ifstream in_;
};

} // namespace recordio::log
