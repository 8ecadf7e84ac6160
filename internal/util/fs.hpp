#pragma once

#include <filesystem>

namespace pipeline::util {

// fsync helpers. Both throw std::system_error.
void SyncFile(const std::filesystem::path& path);
void SyncDirectory(const std::filesystem::path& dir);

/*
  Copies src to `{dst}.partial` and renames it over dst, so dst is
  always either absent, the old file, or a complete copy.
*/
void CopyFileAtomic(const std::filesystem::path& src, const std::filesystem::path& dst, bool fsync);

} // namespace pipeline::util
