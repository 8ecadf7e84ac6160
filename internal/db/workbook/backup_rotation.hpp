#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace pipeline::db::workbook {

struct BackupEntry {
  std::filesystem::path path;
  std::string           timestamp; // yyyyMMdd_HHmmss
};

/*
  BackupRotation

  Timestamped copies of the durable file, named
  {stem}_{yyyyMMdd_HHmmss}{ext}.bak in the same directory.

  Only names matching that pattern exactly are listed or pruned, so
  unrelated files beside the store are never touched. The timestamp is
  fixed width, so name order is age order.
*/
class BackupRotation {
 public:
  explicit BackupRotation(std::filesystem::path durable_path);

  std::filesystem::path BackupPathFor(util::TimePoint when) const;

  // Copies the durable file into a new backup. Two backups in the same
  // second share a name; the later one wins.
  std::filesystem::path CreateBackup(util::TimePoint when, bool fsync) const;

  // Newest first.
  std::vector<BackupEntry> List() const;

  std::optional<BackupEntry> Latest() const;

  // Keeps the newest `keep`; returns the number removed.
  std::size_t Prune(std::size_t keep) const;

 private:
  bool ParseName(const std::string& filename, std::string* timestamp) const;

  std::filesystem::path durable_path_;
  std::filesystem::path directory_;
  std::string           stem_;
  std::string           extension_;
};

} // namespace pipeline::db::workbook
