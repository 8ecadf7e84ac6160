#pragma once

#include <chrono>
#include <filesystem>
#include <optional>

namespace pipeline::db::workbook {

struct LockOptions {
  int                       max_attempts    = 10;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(100);
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(2000);
};

/*
  FileLock

  Cross-process exclusive lock on a marker file ({path}.lock).

  Exclusion comes from flock(LOCK_EX) on the marker, not from the
  marker's existence: the kernel drops the lock when its holder dies,
  so a marker left behind by a crashed process never blocks anyone.
  After locking, the descriptor's inode is compared with the path's so
  a marker unlinked by a releasing holder is never trusted.

  Release (or destruction) unlinks the marker, then drops the lock.
*/
class FileLock {
 public:
  // Retries with exponential backoff; throws util::LockTimeoutError.
  FileLock(std::filesystem::path lock_path, const LockOptions& options);
  ~FileLock();

  FileLock(const FileLock&)            = delete;
  FileLock& operator=(const FileLock&) = delete;

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;

  // Single non-blocking attempt.
  static std::optional<FileLock> TryAcquire(const std::filesystem::path& lock_path);

  const std::filesystem::path& Path() const {
    return path_;
  }

  bool Held() const {
    return fd_ >= 0;
  }

  void Release();

 private:
  FileLock() = default;

  std::filesystem::path path_;
  int                   fd_ = -1;
};

std::filesystem::path LockPathFor(const std::filesystem::path& durable_path);

} // namespace pipeline::db::workbook
