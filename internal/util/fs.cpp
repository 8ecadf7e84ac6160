#include "fs.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace pipeline::util {

namespace {

void SyncPath(const std::filesystem::path& path, int flags, const char* what) {
  int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), std::string(what) + " open failed: " + path.string());
  }
  if (::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    throw std::system_error(err, std::generic_category(), std::string(what) + " flush failed: " + path.string());
  }
  ::close(fd);
}

} // namespace

void SyncFile(const std::filesystem::path& path) {
  SyncPath(path, O_RDONLY, "file");
}

void SyncDirectory(const std::filesystem::path& dir) {
  SyncPath(dir.empty() ? std::filesystem::path(".") : dir, O_RDONLY | O_DIRECTORY, "directory");
}

void CopyFileAtomic(const std::filesystem::path& src, const std::filesystem::path& dst, bool fsync) {
  const std::filesystem::path partial = dst.string() + ".partial";

  try {
    std::filesystem::copy_file(src, partial, std::filesystem::copy_options::overwrite_existing);
    if (fsync) SyncFile(partial);
    std::filesystem::rename(partial, dst);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    throw;
  }

  if (fsync) SyncDirectory(dst.parent_path());
}

} // namespace pipeline::util
