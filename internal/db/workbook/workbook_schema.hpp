#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/workbook/workbook.hpp"

namespace pipeline::db::workbook {

inline constexpr std::string_view kLegacySchemaVersion = "1.0";

// Deals columns whose absence makes a file structurally invalid.
const std::vector<std::string>& RequiredDealColumns();

/*
  Which on-disk layouts this process reads and which one it writes.
*/
struct SchemaPolicy {
  std::string              current_version    = "1.2";
  std::vector<std::string> supported_versions = {"1.0", "1.1", "1.2"};

  bool IsSupported(std::string_view version) const;
};

/*
  Structural health of a durable file. Computed on demand, never stored.

  `valid` covers structure only. A well-formed file stamped with a version
  outside the supported set is valid with version_supported == false;
  callers must refuse it instead of restoring a backup over it.
*/
struct ValidationResult {
  bool                     valid = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  std::size_t deal_count         = 0;
  bool        has_deals_table    = false;
  bool        has_lookups_table  = false;
  bool        has_metadata_table = false;

  std::string detected_version;
  bool        version_supported  = false;
  bool        migration_required = false;
};

// Version stamped in the Metadata table; legacy "1.0" when absent.
std::string DetectVersion(const Workbook& workbook);

ValidationResult ValidateWorkbook(const Workbook& workbook, const SchemaPolicy& policy);

// Reads and validates; on success the parsed workbook is moved into `out`.
ValidationResult ValidateWorkbookFile(const std::filesystem::path& path, const SchemaPolicy& policy, Workbook* out = nullptr);

} // namespace pipeline::db::workbook
