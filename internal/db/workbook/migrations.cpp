#include "migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::db::workbook {

namespace {

Table& EnsureMetadataTable(Workbook& workbook) {
  if (Table* metadata = workbook.FindTable(kMetadataTable)) return *metadata;
  return workbook.AddTable(std::string(kMetadataTable), {std::string(kPropertyColumn), std::string(kValueColumn)});
}

// 1.0 files carry no version stamp; give them a Metadata table and one.
void AddVersionStamp(Workbook& workbook) {
  Table& metadata = EnsureMetadataTable(workbook);
  auto   version  = GetMetadataValue(metadata, kVersionProperty);
  if (!version || version->empty() || *version == "1.0") {
    SetMetadataValue(metadata, kVersionProperty, "1.1");
  }
}

void BumpToOnePointTwo(Workbook& workbook) {
  SetMetadataValue(EnsureMetadataTable(workbook), kVersionProperty, "1.2");
}

} // namespace

MigrationChain MigrationChain::Default() {
  MigrationChain chain;
  chain.Register({"1.0", "1.1", "add_metadata_version_stamp", AddVersionStamp});
  chain.Register({"1.1", "1.2", "bump_metadata_version", BumpToOnePointTwo});
  return chain;
}

void MigrationChain::Register(Migration migration) {
  steps_.push_back(std::move(migration));
}

const Migration* MigrationChain::Next(const std::string& from) const {
  for (const auto& step : steps_) {
    if (step.from == from) return &step;
  }
  return nullptr;
}

bool MigrationChain::HasPath(const std::string& from, const std::string& to) const {
  std::string current = from;
  for (std::size_t hops = 0; hops <= steps_.size(); ++hops) {
    if (current == to) return true;
    const Migration* step = Next(current);
    if (!step) return false;
    current = step->to;
  }
  return false;
}

std::vector<std::string> MigrationChain::Migrate(Workbook& workbook, const std::string& from, const std::string& to) const {
  if (!HasPath(from, to)) {
    throw util::UnsupportedVersionError(from, "No migration path from schema version " + from + " to " + to);
  }

  std::vector<std::string> applied;
  std::string              current = from;
  while (current != to) {
    const Migration* step = Next(current);
    step->apply(workbook);
    applied.push_back(step->name);
    PIPELINE_LOG_INFO("Applied schema migration", {observability::StringField("migration", step->name),
                                                  observability::StringField("from", step->from),
                                                  observability::StringField("to", step->to)});
    current = step->to;
  }
  return applied;
}

} // namespace pipeline::db::workbook
