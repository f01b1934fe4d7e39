#include "arrow_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace modelreg::storage::common {

namespace {

void SyncPath(const std::filesystem::path& path, int flags) {
  const int fd = ::open(path.c_str(), flags);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "open for fsync failed: " + path.string());
  }
  const int rc        = ::fsync(fd);
  const int saved_err = errno;
  ::close(fd);
  if (rc != 0) {
    throw std::system_error(saved_err, std::generic_category(), "fsync failed: " + path.string());
  }
}

} // namespace

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer;
}

void WriteFile(const std::filesystem::path& path, const uint8_t* data, int64_t size, bool fsync) {
  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(path.string()));
    Unwrap(out->Write(data, size));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  if (fsync) {
    SyncPath(path, O_RDONLY);
  }
}

std::filesystem::path TempPathFor(const std::filesystem::path& path) {
  return std::filesystem::path(path.string() + ".tmp");
}

void SyncDirectory(const std::filesystem::path& dir) {
  SyncPath(dir.empty() ? std::filesystem::path(".") : dir, O_RDONLY | O_DIRECTORY);
}

void AtomicReplace(const std::filesystem::path& path, const uint8_t* data, int64_t size, bool fsync) {
  const auto tmp_path = TempPathFor(path);

  try {
    WriteFile(tmp_path, data, size, fsync);
    std::filesystem::rename(tmp_path, path);
  } catch (...) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  if (fsync) {
    SyncDirectory(path.parent_path());
  }
}

} // namespace modelreg::storage::common
