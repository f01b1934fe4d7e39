#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace modelreg::store::file {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string BusyMessage(const std::filesystem::path& path, std::chrono::milliseconds timeout) {
  return "registry lock " + path.string() + " not acquired within " + std::to_string(timeout.count()) + " ms";
}

} // namespace

std::filesystem::path FileLock::LockPathFor(const std::filesystem::path& document_path) {
  auto lock_path = document_path;
  lock_path += ".lock";
  return lock_path;
}

std::shared_ptr<std::timed_mutex> FileLock::ProcessMutex(const std::filesystem::path& lock_path) {
  static std::mutex                                                         guard;
  static std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> mutexes;

  std::lock_guard<std::mutex> lock(guard);
  auto&                       mutex = mutexes[std::filesystem::absolute(lock_path).lexically_normal().string()];
  if (!mutex) {
    mutex = std::make_shared<std::timed_mutex>();
  }
  return mutex;
}

FileLock::FileLock(const std::filesystem::path& lock_path, std::chrono::milliseconds timeout) : path_(lock_path), mutex_(ProcessMutex(lock_path)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  if (!mutex_->try_lock_until(deadline)) {
    throw util::RegistryBusy(BusyMessage(path_, timeout));
  }

  fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    const int err = errno;
    mutex_->unlock();
    throw std::runtime_error("cannot open registry lock " + path_.string() + ": " + std::strerror(err));
  }

  while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    if (err == EINTR) continue;
    if (err != EWOULDBLOCK || std::chrono::steady_clock::now() >= deadline) {
      ::close(fd_);
      fd_ = -1;
      mutex_->unlock();
      if (err != EWOULDBLOCK) {
        throw std::runtime_error("flock " + path_.string() + ": " + std::strerror(err));
      }
      throw util::RegistryBusy(BusyMessage(path_, timeout));
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

FileLock::~FileLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
  mutex_->unlock();
}

} // namespace modelreg::store::file
