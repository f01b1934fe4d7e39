#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

namespace modelreg::store::file {

/*
  Exclusive writer lock for one registry document.

  Two layers:
    - an in-process timed mutex keyed by lock path (flock is per open file
      description, so threads of one process would not exclude each other)
    - flock(LOCK_EX) on "<document>.lock" for other processes

  Both are acquired within `timeout`; otherwise util::RegistryBusy.
  Released on destruction.
*/
class FileLock {
 public:
  FileLock(const std::filesystem::path& lock_path, std::chrono::milliseconds timeout);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  static std::filesystem::path LockPathFor(const std::filesystem::path& document_path);

 private:
  static std::shared_ptr<std::timed_mutex> ProcessMutex(const std::filesystem::path& lock_path);

  std::filesystem::path             path_;
  std::shared_ptr<std::timed_mutex> mutex_;
  int                               fd_ = -1;
};

} // namespace modelreg::store::file
