#include "backup_rotation.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/fs.hpp"

namespace pipeline::db::workbook {

namespace {

constexpr const char* kBackupSuffix = ".bak";

// yyyyMMdd_HHmmss
bool IsBackupTimestamp(const std::string& text) {
  if (text.size() != 15 || text[8] != '_') return false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 8) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

} // namespace

BackupRotation::BackupRotation(std::filesystem::path durable_path)
    : durable_path_(std::move(durable_path)),
      directory_(durable_path_.parent_path()),
      stem_(durable_path_.stem().string()),
      extension_(durable_path_.extension().string()) {
  if (directory_.empty()) directory_ = ".";
}

std::filesystem::path BackupRotation::BackupPathFor(util::TimePoint when) const {
  return directory_ / (stem_ + "_" + util::FormatBackupTimestamp(when) + extension_ + kBackupSuffix);
}

std::filesystem::path BackupRotation::CreateBackup(util::TimePoint when, bool fsync) const {
  auto target = BackupPathFor(when);
  util::CopyFileAtomic(durable_path_, target, fsync);

  PIPELINE_LOG_INFO("Backup created", {observability::PathField("backup", target)});
  return target;
}

bool BackupRotation::ParseName(const std::string& filename, std::string* timestamp) const {
  const std::string prefix = stem_ + "_";
  const std::string suffix = extension_ + kBackupSuffix;

  if (filename.size() != prefix.size() + 15 + suffix.size()) return false;
  if (filename.compare(0, prefix.size(), prefix) != 0) return false;
  if (filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

  std::string middle = filename.substr(prefix.size(), 15);
  if (!IsBackupTimestamp(middle)) return false;

  *timestamp = std::move(middle);
  return true;
}

std::vector<BackupEntry> BackupRotation::List() const {
  std::vector<BackupEntry> entries;

  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) return entries;

  for (const auto& item : std::filesystem::directory_iterator(directory_)) {
    if (!item.is_regular_file()) continue;

    std::string timestamp;
    if (ParseName(item.path().filename().string(), &timestamp)) {
      entries.push_back(BackupEntry{item.path(), std::move(timestamp)});
    }
  }

  std::sort(entries.begin(), entries.end(), [](const BackupEntry& a, const BackupEntry& b) { return a.timestamp > b.timestamp; });
  return entries;
}

std::optional<BackupEntry> BackupRotation::Latest() const {
  auto entries = List();
  if (entries.empty()) return std::nullopt;
  return entries.front();
}

std::size_t BackupRotation::Prune(std::size_t keep) const {
  auto        entries = List();
  std::size_t removed = 0;

  for (std::size_t i = keep; i < entries.size(); ++i) {
    if (std::filesystem::remove(entries[i].path)) ++removed;
  }

  if (removed > 0) {
    PIPELINE_LOG_INFO("Pruned backups",
                      {observability::PathField("store", durable_path_), observability::IntField("removed", static_cast<int64_t>(removed))});
  }
  return removed;
}

} // namespace pipeline::db::workbook
