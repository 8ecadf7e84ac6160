#include "workbook.hpp"

#include "internal/util/strings.hpp"

namespace pipeline::db::workbook {

std::optional<std::size_t> Table::ColumnIndex(std::string_view column) const {
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (util::EqualsIgnoreCase(columns[i], column)) return i;
  }
  return std::nullopt;
}

std::size_t Table::EnsureColumn(std::string_view column) {
  if (auto index = ColumnIndex(column)) return *index;
  columns.emplace_back(column);
  for (auto& row : rows) {
    row.resize(columns.size());
  }
  return columns.size() - 1;
}

const std::string& Table::Cell(std::size_t row, std::size_t column) const {
  static const std::string kEmpty;
  if (row >= rows.size() || column >= rows[row].size()) return kEmpty;
  return rows[row][column];
}

void Table::SetCell(std::size_t row, std::size_t column, std::string value) {
  if (rows[row].size() <= column) rows[row].resize(column + 1);
  rows[row][column] = std::move(value);
}

Row& Table::AppendRow() {
  rows.emplace_back(columns.size());
  return rows.back();
}

bool Table::IsBlankRow(std::size_t row) const {
  for (const auto& cell : rows[row]) {
    if (!util::IsBlank(cell)) return false;
  }
  return true;
}

Table* Workbook::FindTable(std::string_view name) {
  for (auto& table : tables) {
    if (util::EqualsIgnoreCase(table.name, name)) return &table;
  }
  return nullptr;
}

const Table* Workbook::FindTable(std::string_view name) const {
  for (const auto& table : tables) {
    if (util::EqualsIgnoreCase(table.name, name)) return &table;
  }
  return nullptr;
}

Table& Workbook::AddTable(std::string name, std::vector<std::string> columns) {
  tables.push_back(Table{std::move(name), std::move(columns), {}});
  return tables.back();
}

std::string HeaderKey(std::string_view header) {
  return util::ToLower(util::RemoveAll(util::Trim(header), {" ", "_"}));
}

std::optional<std::string> GetMetadataValue(const Table& metadata, std::string_view property) {
  const auto key   = metadata.ColumnIndex(kPropertyColumn).value_or(0);
  const auto value = metadata.ColumnIndex(kValueColumn).value_or(1);
  for (std::size_t row = 0; row < metadata.rows.size(); ++row) {
    if (util::EqualsIgnoreCase(util::Trim(metadata.Cell(row, key)), property)) {
      return util::Trim(metadata.Cell(row, value));
    }
  }
  return std::nullopt;
}

void SetMetadataValue(Table& metadata, std::string_view property, std::string value) {
  const auto key    = metadata.EnsureColumn(kPropertyColumn);
  const auto column = metadata.EnsureColumn(kValueColumn);
  for (std::size_t row = 0; row < metadata.rows.size(); ++row) {
    if (util::EqualsIgnoreCase(util::Trim(metadata.Cell(row, key)), property)) {
      metadata.SetCell(row, column, std::move(value));
      return;
    }
  }
  auto& row   = metadata.AppendRow();
  row[key]    = std::string(property);
  row[column] = std::move(value);
}

} // namespace pipeline::db::workbook
