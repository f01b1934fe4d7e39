#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace modelreg::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Write `data` to `path`, truncating. With `fsync` the bytes are on stable
  storage when this returns.
*/
void WriteFile(const std::filesystem::path& path, const uint8_t* data, int64_t size, bool fsync);

inline void WriteFile(const std::filesystem::path& path, std::string_view data, bool fsync) {
  WriteFile(path, reinterpret_cast<const uint8_t*>(data.data()), static_cast<int64_t>(data.size()), fsync);
}

/*
  Atomic replace:
      write tmp → flush → rename

  Readers observe either the old file or the new one, never a mix. The temp
  file is removed if anything before the rename fails.
*/
void AtomicReplace(const std::filesystem::path& path, const uint8_t* data, int64_t size, bool fsync);

inline void AtomicReplace(const std::filesystem::path& path, std::string_view data, bool fsync) {
  AtomicReplace(path, reinterpret_cast<const uint8_t*>(data.data()), static_cast<int64_t>(data.size()), fsync);
}

// Sibling temp path used by AtomicReplace ("<path>.tmp").
std::filesystem::path TempPathFor(const std::filesystem::path& path);

// fsync a directory so a completed rename survives power loss.
void SyncDirectory(const std::filesystem::path& dir);

} // namespace modelreg::storage::common
