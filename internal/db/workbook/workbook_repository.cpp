#include "workbook_repository.hpp"

#include <cstdio>
#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/db/api/deal_set.hpp"
#include "internal/db/workbook/layout_codec.hpp"
#include "internal/db/workbook/workbook_io.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/fs.hpp"
#include "internal/util/strings.hpp"

namespace pipeline::db::workbook {

namespace {

std::string RandomSuffix() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  char                         buf[9];
  std::snprintf(buf, sizeof(buf), "%08X", static_cast<unsigned>(rng() & 0xFFFFFFFFu));
  return buf;
}

void EnsureParentDirectory(const std::filesystem::path& path) {
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir);
}

} // namespace

void ThrowIfStoreError(const db::Result& result, const std::string& what) {
  if (result) return;

  const auto message = what + " (" + db::ErrorCodeName(result.code) + "): " + result.message;
  if (result.IsDamaged()) throw util::IntegrityError(message);
  throw std::runtime_error(message);
}

std::optional<model::LookupTables> ReadLookupsFile(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) return std::nullopt;

  Workbook workbook;
  ThrowIfStoreError(ReadWorkbook(path, workbook), "Failed to read " + path.string());
  return DecodeLookups(workbook);
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

WorkbookDealRepository::WorkbookDealRepository(WorkbookStoreOptions                          options,
                                               std::shared_ptr<const context::SystemContext> context,
                                               std::shared_ptr<const model::LookupTables>    lookups,
                                               MigrationChain                                migrations)
    : options_(std::move(options)),
      context_(std::move(context)),
      migrations_(std::move(migrations)),
      rotation_(options_.path),
      lookups_(std::move(lookups)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("WorkbookDealRepository requires a file path");
  }
  if (!context_ || !lookups_) {
    throw std::invalid_argument("WorkbookDealRepository requires a context and lookup tables");
  }
  if (!options_.schema.IsSupported(options_.schema.current_version)) {
    throw util::UnsupportedVersionError(options_.schema.current_version,
                                        "Current schema version " + options_.schema.current_version + " is not in the supported set");
  }
  normalizer_     = std::make_shared<normalize::DealNormalizer>(lookups_, context_);
  loaded_version_ = options_.schema.current_version;
}

void WorkbookDealRepository::SetCommitHooks(CommitHooks hooks) {
  std::lock_guard lock(hooks_mutex_);
  hooks_ = std::move(hooks);
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

void WorkbookDealRepository::EnsureLoaded() {
  if (loaded_.load(std::memory_order_acquire)) return;

  std::unique_lock lock(state_mutex_);
  if (!loaded_.load(std::memory_order_relaxed)) LoadLocked();
}

void WorkbookDealRepository::Load() {
  EnsureLoaded();
}

void WorkbookDealRepository::Reload() {
  std::lock_guard  commit(commit_mutex_);
  std::unique_lock lock(state_mutex_);
  LoadLocked();
}

void WorkbookDealRepository::LoadLocked() {
  const auto& path   = options_.path;
  const auto& policy = options_.schema;

  if (!std::filesystem::exists(path)) {
    deals_.clear();
    loaded_version_ = policy.current_version;
    mutation_gen_   = 0;
    committed_gen_  = 0;
    loaded_.store(true, std::memory_order_release);

    PIPELINE_LOG_INFO("Workbook absent, starting empty",
                      {observability::PathField("path", path), observability::StringField("version", loaded_version_)});
    return;
  }

  Workbook workbook;
  auto     validation = ValidateWorkbookFile(path, policy, &workbook);

  if (!validation.valid) {
    PIPELINE_LOG_WARN("Workbook failed validation, attempting restore",
                      {observability::PathField("path", path), observability::StringField("errors", util::Join(validation.errors, "; "))});

    bool restored = false;
    {
      FileLock file_lock(LockPathFor(path), options_.lock);
      restored = RestoreNewestValidBackup();
    }
    if (!restored) {
      throw util::IntegrityError("Workbook " + path.string() + " is invalid and no valid backup exists: " + util::Join(validation.errors, "; "));
    }

    workbook   = Workbook{};
    validation = ValidateWorkbookFile(path, policy, &workbook);
    if (!validation.valid) {
      throw util::IntegrityError("Workbook " + path.string() + " is invalid after restore: " + util::Join(validation.errors, "; "));
    }
  }

  if (!validation.version_supported) {
    throw util::UnsupportedVersionError(validation.detected_version, "Workbook " + path.string() + " has unsupported schema version " +
                                                                         validation.detected_version);
  }

  auto decoded = DecodeWorkbook(std::move(workbook), migrations_, policy.current_version);

  std::vector<model::Deal> deals;
  deals.reserve(decoded.deals.size());
  for (const auto& deal : decoded.deals) {
    UpsertDeal(deals, normalizer_->Normalize(deal));
  }

  deals_          = std::move(deals);
  loaded_version_ = decoded.source_version;
  committed_gen_  = 0;
  mutation_gen_   = decoded.migrations_applied.empty() ? 0 : 1;
  loaded_.store(true, std::memory_order_release);

  PIPELINE_LOG_INFO("Workbook loaded", {observability::PathField("path", path),
                                        observability::StringField("version", loaded_version_),
                                        observability::IntField("deals", static_cast<int64_t>(deals_.size())),
                                        observability::IntField("migrations", static_cast<int64_t>(decoded.migrations_applied.size()))});
}

bool WorkbookDealRepository::RestoreNewestValidBackup() {
  for (const auto& backup : rotation_.List()) {
    auto check = ValidateWorkbookFile(backup.path, options_.schema);
    if (!check.valid) {
      PIPELINE_LOG_WARN("Skipping invalid backup", {observability::PathField("backup", backup.path)});
      continue;
    }
    if (!check.version_supported || !migrations_.HasPath(check.detected_version, options_.schema.current_version)) {
      PIPELINE_LOG_WARN("Skipping backup with unsupported schema version",
                        {observability::PathField("backup", backup.path), observability::StringField("version", check.detected_version)});
      continue;
    }

    util::CopyFileAtomic(backup.path, options_.path, options_.fsync);
    PIPELINE_LOG_WARN("Workbook restored from backup",
                      {observability::PathField("path", options_.path), observability::PathField("backup", backup.path)});
    return true;
  }
  return false;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::vector<model::Deal> WorkbookDealRepository::GetAll() {
  EnsureLoaded();
  std::shared_lock lock(state_mutex_);
  return deals_;
}

std::optional<model::Deal> WorkbookDealRepository::GetById(const std::string& deal_id) {
  EnsureLoaded();
  std::shared_lock lock(state_mutex_);
  auto             it = FindDeal(std::as_const(deals_), deal_id);
  if (it == deals_.cend()) return std::nullopt;
  return *it;
}

std::vector<model::Deal> WorkbookDealRepository::Query(const DealFilter& filter, util::Date reference_date) {
  EnsureLoaded();
  std::shared_lock         lock(state_mutex_);
  std::vector<model::Deal> matches;
  for (const auto& deal : deals_) {
    if (filter.Matches(deal, reference_date)) matches.push_back(deal);
  }
  return matches;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

void WorkbookDealRepository::Upsert(const model::Deal& deal) {
  EnsureLoaded();
  std::unique_lock lock(state_mutex_);
  UpsertDeal(deals_, deal);
  ++mutation_gen_;
}

void WorkbookDealRepository::UpsertMany(const std::vector<model::Deal>& deals) {
  EnsureLoaded();
  std::unique_lock lock(state_mutex_);
  UpsertDeals(deals_, deals);
  ++mutation_gen_;
}

void WorkbookDealRepository::Delete(const std::string& deal_id) {
  EnsureLoaded();
  std::unique_lock lock(state_mutex_);
  if (EraseDeal(deals_, deal_id)) ++mutation_gen_;
}

// ------------------------------------------------------------
// Commit
// ------------------------------------------------------------

std::filesystem::path WorkbookDealRepository::MakeTempPath(const std::filesystem::path& target) const {
  auto dir = target.parent_path();
  if (dir.empty()) dir = ".";

  const auto stem = target.stem().string();
  const auto ext  = target.extension().string();

  std::filesystem::path temp;
  do {
    temp = dir / ("~" + stem + "." + RandomSuffix() + ".tmp" + ext);
  } while (std::filesystem::exists(temp));
  return temp;
}

void WorkbookDealRepository::SaveChanges() {
  std::lock_guard commit(commit_mutex_);
  EnsureLoaded();

  const auto& path   = options_.path;
  const auto& policy = options_.schema;

  std::vector<model::Deal>                   snapshot;
  std::shared_ptr<const model::LookupTables> lookups;
  uint64_t                                   generation = 0;
  {
    std::shared_lock lock(state_mutex_);
    if (mutation_gen_ == committed_gen_ && std::filesystem::exists(path)) return;
    snapshot   = deals_;
    lookups    = lookups_;
    generation = mutation_gen_;
  }

  CommitHooks hooks;
  {
    std::lock_guard lock(hooks_mutex_);
    hooks = hooks_;
  }

  EnsureParentDirectory(path);
  bool backed_up = false;
  {
    FileLock file_lock(LockPathFor(path), options_.lock);

    const auto temp = MakeTempPath(path);
    try {
      const auto& encoder  = EncoderFor(policy.current_version);
      auto        workbook = encoder.Encode(snapshot, *lookups, MetadataStamp{context_->Now(), options_.generated_by});

      ThrowIfStoreError(WriteWorkbook(temp, workbook, options_.fsync), "Failed to write " + temp.string());

      auto check = ValidateWorkbookFile(temp, policy);
      if (!check.valid) {
        throw util::IntegrityError("Temp workbook failed validation: " + util::Join(check.errors, "; "));
      }
      if (check.detected_version != policy.current_version) {
        throw util::IntegrityError("Temp workbook stamped " + check.detected_version + ", expected " + policy.current_version);
      }
      if (check.deal_count != snapshot.size()) {
        throw util::IntegrityError("Temp workbook holds " + std::to_string(check.deal_count) + " deals, expected " +
                                   std::to_string(snapshot.size()));
      }

      if (hooks.after_validate) hooks.after_validate(temp);

      if (options_.max_backups > 0 && std::filesystem::exists(path)) {
        rotation_.CreateBackup(context_->Now(), options_.fsync);
        backed_up = true;
      }

      if (hooks.before_replace) hooks.before_replace(temp);

      std::filesystem::rename(temp, path);
      if (options_.fsync) util::SyncDirectory(path.parent_path());
    } catch (...) {
      std::error_code ec;
      std::filesystem::remove(temp, ec);
      throw;
    }
  }

  {
    std::unique_lock lock(state_mutex_);
    committed_gen_  = generation;
    loaded_version_ = policy.current_version;
  }

  PIPELINE_LOG_INFO("Workbook committed", {observability::PathField("path", path),
                                           observability::StringField("version", policy.current_version),
                                           observability::IntField("deals", static_cast<int64_t>(snapshot.size())),
                                           observability::BoolField("backup", backed_up)});

  if (options_.max_backups > 0) {
    try {
      rotation_.Prune(options_.max_backups);
    } catch (const std::filesystem::filesystem_error& e) {
      PIPELINE_LOG_WARN("Backup pruning failed", {observability::PathField("path", path), observability::StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

ValidationResult WorkbookDealRepository::Validate() const {
  return ValidateWorkbookFile(options_.path, options_.schema);
}

std::vector<BackupEntry> WorkbookDealRepository::GetBackups() const {
  return rotation_.List();
}

bool WorkbookDealRepository::RestoreFromBackup() {
  std::lock_guard commit(commit_mutex_);

  bool restored = false;
  {
    FileLock file_lock(LockPathFor(options_.path), options_.lock);
    restored = RestoreNewestValidBackup();
  }
  if (!restored) return false;

  std::unique_lock lock(state_mutex_);
  LoadLocked();
  return true;
}

std::string WorkbookDealRepository::LoadedSchemaVersion() {
  EnsureLoaded();
  std::shared_lock lock(state_mutex_);
  return loaded_version_;
}

bool WorkbookDealRepository::IsDirty() const {
  std::shared_lock lock(state_mutex_);
  return mutation_gen_ != committed_gen_;
}

bool WorkbookDealRepository::ImportLookups() {
  auto imported = ReadLookupsFile(options_.path);
  if (!imported) return false;

  auto lookups    = std::make_shared<const model::LookupTables>(std::move(*imported));
  auto normalizer = std::make_shared<const normalize::DealNormalizer>(lookups, context_);

  std::unique_lock lock(state_mutex_);
  lookups_    = std::move(lookups);
  normalizer_ = std::move(normalizer);
  return true;
}

void WorkbookDealRepository::ExportAs(const std::filesystem::path& path, const std::string& version) {
  EnsureLoaded();

  const auto& encoder = EncoderFor(version);

  std::vector<model::Deal>                   snapshot;
  std::shared_ptr<const model::LookupTables> lookups;
  {
    std::shared_lock lock(state_mutex_);
    snapshot = deals_;
    lookups  = lookups_;
  }

  auto workbook = encoder.Encode(snapshot, *lookups, MetadataStamp{context_->Now(), options_.generated_by});

  EnsureParentDirectory(path);
  const auto temp = MakeTempPath(path);
  try {
    ThrowIfStoreError(WriteWorkbook(temp, workbook, options_.fsync), "Failed to write " + temp.string());
    std::filesystem::rename(temp, path);
  } catch (...) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    throw;
  }

  PIPELINE_LOG_INFO("Workbook exported", {observability::PathField("path", path),
                                          observability::StringField("version", version),
                                          observability::IntField("deals", static_cast<int64_t>(snapshot.size()))});
}

} // namespace pipeline::db::workbook
