#include "factory.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/context/clock.hpp"
#include "internal/context/id_generator.hpp"
#include "internal/db/memory/memory_deal_repository.hpp"
#include "internal/normalize/deal_normalizer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace pipeline::factory {

using pipeline::runtime::config::ContextConfig;
using pipeline::runtime::config::RuntimeConfig;
using pipeline::runtime::config::WorkbookStoreConfig;

namespace {

std::shared_ptr<context::SystemContext> BuildContext(const ContextConfig& config) {
  std::optional<util::TimePoint> fixed;
  if (!config.fixed_time().empty()) {
    fixed = util::ParseIso8601(config.fixed_time());
    if (!fixed) {
      throw std::runtime_error("Invalid configuration: context.fixed_time is not an ISO-8601 date or time: " + config.fixed_time());
    }
  }

  const bool replayable = config.mode() == ContextConfig::SEQUENTIAL || config.mode() == ContextConfig::SEEDED;
  if (replayable && !fixed) {
    throw std::runtime_error("Invalid configuration: context.fixed_time is required for seeded and sequential modes");
  }

  switch (config.mode()) {
    case ContextConfig::SEQUENTIAL:
      return context::SystemContext::ForTesting(util::ToDate(*fixed));

    case ContextConfig::SEEDED:
      return context::SystemContext::ForSyntheticData(util::ToDate(*fixed), config.seed());

    default:
      break;
  }

  if (fixed) {
    // Live ids against a pinned clock, for replaying a session at a known time.
    auto clock = std::make_shared<context::FixedClock>(*fixed);
    return std::make_shared<context::SystemContext>(clock, std::make_shared<context::RandomIdGenerator>(clock));
  }
  return context::SystemContext::Default();
}

} // namespace

db::workbook::WorkbookStoreOptions ToStoreOptions(const WorkbookStoreConfig& config) {
  db::workbook::WorkbookStoreOptions options;
  options.path        = config.path();
  options.max_backups = config.max_backups();
  options.fsync       = config.fsync();

  options.lock.max_attempts    = static_cast<int>(config.lock().max_attempts());
  options.lock.initial_backoff = std::chrono::milliseconds(config.lock().initial_backoff_ms());
  options.lock.max_backoff     = std::chrono::milliseconds(config.lock().max_backoff_ms());

  options.schema.current_version = config.current_schema_version();
  options.schema.supported_versions.assign(config.supported_schema_versions().begin(), config.supported_schema_versions().end());
  return options;
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Context + lookups
  // ------------------------------------------------------------------
  deps.context = BuildContext(config.context());

  auto lookups = model::LookupTables::CreateDefault();
  if (config.store().has_workbook() && config.store().workbook().import_lookups()) {
    if (auto imported = db::workbook::ReadLookupsFile(config.store().workbook().path())) {
      lookups = std::move(*imported);
      PIPELINE_LOG_INFO("Imported lookup tables", {observability::StringField("path", config.store().workbook().path())});
    }
  }
  deps.lookups = std::make_shared<const model::LookupTables>(std::move(lookups));

  // ------------------------------------------------------------------
  // Repository
  // ------------------------------------------------------------------
  if (config.store().has_workbook()) {
    deps.workbook_store =
        std::make_shared<db::workbook::WorkbookDealRepository>(ToStoreOptions(config.store().workbook()), deps.context, deps.lookups);
    deps.repository = deps.workbook_store;
  } else {
    deps.repository = std::make_shared<db::memory::MemoryDealRepository>();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.context    = deps.context;
  ctx.normalizer = std::make_shared<const normalize::DealNormalizer>(deps.lookups, deps.context);
  ctx.repository = deps.repository;

  deps.pipeline_service = std::make_shared<service::PipelineService>(ctx);

  return deps;
}

} // namespace pipeline::factory
