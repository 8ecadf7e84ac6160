#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipeline::db::workbook {

/*
  Generic table model of the durable file.

  Every cell is text. Migrations and validation work on this model only;
  domain types are built from it by the layout codec.
*/

inline constexpr std::string_view kDealsTable    = "Deals";
inline constexpr std::string_view kLookupsTable  = "Lookups";
inline constexpr std::string_view kMetadataTable = "Metadata";

inline constexpr std::string_view kPropertyColumn = "Property";
inline constexpr std::string_view kValueColumn    = "Value";
inline constexpr std::string_view kVersionProperty = "Version";

using Row = std::vector<std::string>;

struct Table {
  std::string              name;
  std::vector<std::string> columns;
  std::vector<Row>         rows;

  // Case-insensitive exact header match.
  std::optional<std::size_t> ColumnIndex(std::string_view column) const;

  // Appends the column (empty cells in existing rows) unless present.
  std::size_t EnsureColumn(std::string_view column);

  // Empty string for cells past the end of a short row.
  const std::string& Cell(std::size_t row, std::size_t column) const;

  void SetCell(std::size_t row, std::size_t column, std::string value);

  Row& AppendRow();

  bool IsBlankRow(std::size_t row) const;

  bool operator==(const Table&) const = default;
};

struct Workbook {
  std::vector<Table> tables;

  Table*       FindTable(std::string_view name);
  const Table* FindTable(std::string_view name) const;

  Table& AddTable(std::string name, std::vector<std::string> columns);

  bool operator==(const Workbook&) const = default;
};

// Header comparison key: lower-case with spaces and underscores removed.
std::string HeaderKey(std::string_view header);

// ---------------------------------------------------------------------
// Metadata key/value table
// ---------------------------------------------------------------------

std::optional<std::string> GetMetadataValue(const Table& metadata, std::string_view property);

// Updates the first matching row or appends a new one.
void SetMetadataValue(Table& metadata, std::string_view property, std::string value);

} // namespace pipeline::db::workbook
