#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/context/system_context.hpp"
#include "internal/db/api/deal_repository.hpp"
#include "internal/db/workbook/workbook_repository.hpp"
#include "internal/model/lookup_tables.hpp"
#include "internal/service/pipeline_service.hpp"

namespace pipeline::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by the command-line tool.
  Everything here lives for the lifetime of the process.

  workbook_store aliases repository when the workbook backend is
  configured and is null for the in-memory backend.
*/
struct RuntimeDependencies {
  std::shared_ptr<context::SystemContext> context;
  std::shared_ptr<const model::LookupTables> lookups;

  std::shared_ptr<db::DealRepository> repository;
  std::shared_ptr<db::workbook::WorkbookDealRepository> workbook_store;

  std::shared_ptr<service::PipelineService> pipeline_service;
};


/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete repository types.
*/
RuntimeDependencies BuildRuntime(
    const pipeline::runtime::config::RuntimeConfig& config);

// Store options from the workbook section; config is assumed validated.
db::workbook::WorkbookStoreOptions ToStoreOptions(
    const pipeline::runtime::config::WorkbookStoreConfig& config);

}
