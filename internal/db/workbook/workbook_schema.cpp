#include "workbook_schema.hpp"

#include <algorithm>
#include <set>

#include "internal/db/workbook/workbook_io.hpp"
#include "internal/util/strings.hpp"

namespace pipeline::db::workbook {

const std::vector<std::string>& RequiredDealColumns() {
  static const std::vector<std::string> kColumns = {"DealId", "AccountName", "DealName", "Stage"};
  return kColumns;
}

bool SchemaPolicy::IsSupported(std::string_view version) const {
  return std::find(supported_versions.begin(), supported_versions.end(), version) != supported_versions.end();
}

std::string DetectVersion(const Workbook& workbook) {
  const Table* metadata = workbook.FindTable(kMetadataTable);
  if (!metadata) return std::string(kLegacySchemaVersion);

  auto version = GetMetadataValue(*metadata, kVersionProperty);
  if (!version || version->empty()) return std::string(kLegacySchemaVersion);
  return *version;
}

ValidationResult ValidateWorkbook(const Workbook& workbook, const SchemaPolicy& policy) {
  ValidationResult result;

  const Table* deals = workbook.FindTable(kDealsTable);
  result.has_deals_table    = deals != nullptr;
  result.has_lookups_table  = workbook.FindTable(kLookupsTable) != nullptr;
  result.has_metadata_table = workbook.FindTable(kMetadataTable) != nullptr;

  if (!deals) {
    result.errors.push_back("Missing required table: " + std::string(kDealsTable));
  } else {
    std::set<std::string> headers;
    for (const auto& column : deals->columns) {
      headers.insert(HeaderKey(column));
    }
    for (const auto& required : RequiredDealColumns()) {
      if (!headers.contains(HeaderKey(required))) {
        result.errors.push_back("Missing required column: " + required);
      }
    }
    for (std::size_t row = 0; row < deals->rows.size(); ++row) {
      if (!deals->IsBlankRow(row)) ++result.deal_count;
    }
  }

  if (!result.has_lookups_table) {
    result.warnings.push_back("Missing optional table: " + std::string(kLookupsTable));
  }
  if (!result.has_metadata_table) {
    result.warnings.push_back("Missing optional table: " + std::string(kMetadataTable));
  }

  result.detected_version   = DetectVersion(workbook);
  result.version_supported  = policy.IsSupported(result.detected_version);
  result.migration_required = result.version_supported && result.detected_version != policy.current_version;
  result.valid              = result.errors.empty();
  return result;
}

ValidationResult ValidateWorkbookFile(const std::filesystem::path& path, const SchemaPolicy& policy, Workbook* out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    ValidationResult result;
    result.errors.push_back("File does not exist: " + path.string());
    return result;
  }

  Workbook workbook;
  if (auto rc = ReadWorkbook(path, workbook); !rc) {
    ValidationResult result;
    result.errors.push_back("Failed to read " + path.string() + ": " + rc.message);
    return result;
  }

  auto result = ValidateWorkbook(workbook, policy);
  if (result.valid && out) *out = std::move(workbook);
  return result;
}

} // namespace pipeline::db::workbook
