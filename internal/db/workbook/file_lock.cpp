#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::db::workbook {

namespace {

// Bounded re-open loop when the marker is replaced under us.
constexpr int kMaxInodeRetries = 64;

// Returns a locked descriptor, or -1 when another holder has the lock.
int TryLockOnce(const std::filesystem::path& path) {
  for (int retry = 0; retry < kMaxInodeRetries; ++retry) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      throw std::system_error(errno, std::generic_category(), "open lock marker " + path.string());
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      const int err = errno;
      ::close(fd);
      if (err == EWOULDBLOCK || err == EINTR) return -1;
      throw std::system_error(err, std::generic_category(), "flock " + path.string());
    }

    struct stat held {};
    struct stat current {};
    if (::fstat(fd, &held) == 0 && ::stat(path.c_str(), &current) == 0 && held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
      return fd;
    }

    // Locked an unlinked marker; the previous holder released. Try again.
    ::close(fd);
  }
  return -1;
}

} // namespace

FileLock::FileLock(std::filesystem::path lock_path, const LockOptions& options) : path_(std::move(lock_path)) {
  auto backoff = options.initial_backoff;
  for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
    fd_ = TryLockOnce(path_);
    if (fd_ >= 0) return;

    if (attempt < options.max_attempts) {
      PIPELINE_LOG_DEBUG("Lock busy, backing off", {observability::PathField("lock", path_), observability::IntField("attempt", attempt),
                                                    observability::IntField("backoff_ms", backoff.count())});
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, options.max_backoff);
    }
  }

  PIPELINE_LOG_WARN("Lock acquisition timed out", {observability::PathField("lock", path_),
                                                   observability::IntField("attempts", options.max_attempts)});
  throw util::LockTimeoutError(path_.string(), "Could not acquire exclusive lock " + path_.string() + " after " +
                                                   std::to_string(options.max_attempts) + " attempts");
}

FileLock::~FileLock() {
  Release();
}

FileLock::FileLock(FileLock&& other) noexcept : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    Release();
    path_ = std::move(other.path_);
    fd_   = std::exchange(other.fd_, -1);
  }
  return *this;
}

std::optional<FileLock> FileLock::TryAcquire(const std::filesystem::path& lock_path) {
  int fd = TryLockOnce(lock_path);
  if (fd < 0) return std::nullopt;

  FileLock lock;
  lock.path_ = lock_path;
  lock.fd_   = fd;
  return lock;
}

void FileLock::Release() {
  if (fd_ < 0) return;
  // Unlink while still holding the lock so no waiter can lock a path we are about to remove.
  ::unlink(path_.c_str());
  ::close(fd_);
  fd_ = -1;
}

std::filesystem::path LockPathFor(const std::filesystem::path& durable_path) {
  return std::filesystem::path(durable_path.string() + ".lock");
}

} // namespace pipeline::db::workbook
