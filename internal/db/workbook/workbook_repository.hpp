#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/context/system_context.hpp"
#include "internal/db/api/deal_repository.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/workbook/backup_rotation.hpp"
#include "internal/db/workbook/file_lock.hpp"
#include "internal/db/workbook/migrations.hpp"
#include "internal/db/workbook/workbook_schema.hpp"
#include "internal/model/lookup_tables.hpp"
#include "internal/normalize/deal_normalizer.hpp"

namespace pipeline::db::workbook {

struct WorkbookStoreOptions {
  std::filesystem::path path;
  std::size_t           max_backups = 5;
  LockOptions           lock;
  SchemaPolicy          schema;
  bool                  fsync        = true;
  std::string           generated_by = "pipeline-manager";
};

/*
  Observation points inside the commit protocol. Both run with the temp
  file fully written and validated, before the durable file is touched;
  throwing from either aborts the commit.
*/
struct CommitHooks {
  std::function<void(const std::filesystem::path& temp_path)> after_validate;
  std::function<void(const std::filesystem::path& temp_path)> before_replace;
};

/*
  WorkbookDealRepository

  Durable store over a single three-table workbook file.

  LOAD (lazy, on first use):
    - absent file         -> empty set at the current version
    - structurally bad    -> restore newest valid backup, else IntegrityError
    - unsupported version -> UnsupportedVersionError, nothing read
    - older version       -> migrate, decode, mark dirty
    Every loaded deal is normalized.

  COMMIT (SaveChanges):
    encode -> temp file -> validate temp -> backup -> rename -> prune
    under the in-process commit mutex and the cross-process file lock.
    Any failure before the rename leaves the durable file untouched and
    removes the temp file.

  Lock order: commit_mutex_ -> state_mutex_. The file lock is never
  taken while state_mutex_ is held by a committer.
*/
class WorkbookDealRepository final : public db::DealRepository {
 public:
  WorkbookDealRepository(WorkbookStoreOptions                          options,
                         std::shared_ptr<const context::SystemContext> context,
                         std::shared_ptr<const model::LookupTables>    lookups,
                         MigrationChain                                migrations = MigrationChain::Default());

  // ---------------------------------------------------------------------
  // DealRepository
  // ---------------------------------------------------------------------

  std::vector<model::Deal>   GetAll() override;
  std::optional<model::Deal> GetById(const std::string& deal_id) override;
  std::vector<model::Deal>   Query(const DealFilter& filter, util::Date reference_date) override;

  void Upsert(const model::Deal& deal) override;
  void UpsertMany(const std::vector<model::Deal>& deals) override;
  void Delete(const std::string& deal_id) override;
  void SaveChanges() override;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  void Load();

  // Discards unsaved changes.
  void Reload();

  ValidationResult Validate() const;

  std::vector<BackupEntry> GetBackups() const;

  // Copies the newest valid backup this build can read over the durable
  // file and reloads. Returns false when no usable backup exists.
  bool RestoreFromBackup();

  // Version the durable file had when loaded; current version after a commit.
  std::string LoadedSchemaVersion();

  bool IsDirty() const;

  // Replaces the lookup tables with those stored in the durable file.
  // Returns false when the file has no Lookups table.
  bool ImportLookups();

  // Writes the in-memory state to `path` in any known layout.
  void ExportAs(const std::filesystem::path& path, const std::string& version);

  const std::filesystem::path& FilePath() const {
    return options_.path;
  }

  void SetCommitHooks(CommitHooks hooks);

 private:
  void EnsureLoaded();
  void LoadLocked();

  // Caller holds the file lock.
  bool RestoreNewestValidBackup();

  std::filesystem::path MakeTempPath(const std::filesystem::path& target) const;

  WorkbookStoreOptions                          options_;
  std::shared_ptr<const context::SystemContext> context_;
  MigrationChain                                migrations_;
  BackupRotation                                rotation_;

  std::mutex        commit_mutex_;
  std::mutex        hooks_mutex_;
  CommitHooks       hooks_;
  std::atomic<bool> loaded_{false};

  mutable std::shared_mutex                     state_mutex_;
  std::vector<model::Deal>                      deals_;
  std::shared_ptr<const model::LookupTables>    lookups_;
  std::shared_ptr<const normalize::DealNormalizer> normalizer_;
  std::string                                   loaded_version_;
  uint64_t                                      mutation_gen_  = 0;
  uint64_t                                      committed_gen_ = 0;
};

// Maps container I/O failures to store exceptions.
void ThrowIfStoreError(const db::Result& result, const std::string& what);

// Lookups stored in a workbook file; nullopt when absent or without a Lookups table.
std::optional<model::LookupTables> ReadLookupsFile(const std::filesystem::path& path);

} // namespace pipeline::db::workbook
