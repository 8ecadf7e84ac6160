#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using pipeline::observability::AmountField;
using pipeline::observability::InitializeLogging;
using pipeline::observability::PathField;
using pipeline::runtime::config::LoggingConfig;

spdlog::level::level_enum CurrentLevel() {
  auto logger = spdlog::get("pipeline-manager");
  assert(logger);
  return logger->level();
}

void TestFieldsRenderDomainValues() {
  const auto amount = AmountField("amount_gbp", 7200.3);
  assert(amount.key == "amount_gbp");
  assert(amount.value == "7200.3");

  assert(AmountField("amount_gbp", std::nullopt).value.empty());
  assert(PathField("path", std::filesystem::path("/tmp/deals.db")).value == "/tmp/deals.db");
}

void TestLevelComesFromConfig() {
  ::unsetenv("PIPELINE_LOG_LEVEL");

  LoggingConfig config;
  config.set_level("WARN");
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::warn);
  assert(spdlog::default_logger()->name() == "pipeline-manager");

  config.clear_level();
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::info);
}

void TestUnknownLevelFallsBackToInfo() {
  ::unsetenv("PIPELINE_LOG_LEVEL");

  LoggingConfig config;
  config.set_level("verbose");
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::info);

  config.set_level("off");
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::off);
}

void TestEnvironmentOverridesConfig() {
  ::setenv("PIPELINE_LOG_LEVEL", "debug", 1);

  LoggingConfig config;
  config.set_level("error");
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::debug);

  // Empty counts as unset.
  ::setenv("PIPELINE_LOG_LEVEL", "", 1);
  InitializeLogging(config);
  assert(CurrentLevel() == spdlog::level::err);

  ::unsetenv("PIPELINE_LOG_LEVEL");
}

} // namespace

int main() {
  TestFieldsRenderDomainValues();
  TestLevelComesFromConfig();
  TestUnknownLevelFallsBackToInfo();
  TestEnvironmentOverridesConfig();

  pipeline::observability::ShutdownLogging();
  std::cout << "pipeline_manager_unit_logging: pass\n";
  return 0;
}
