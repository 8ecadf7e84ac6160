#include "workbook_io.hpp"

#include "internal/db/sqlite/sqlite_db.hpp"

namespace pipeline::db::workbook {

using db::sqlite::OpenMode;
using db::sqlite::QuoteIdentifier;
using db::sqlite::SqliteDB;
using db::sqlite::SqliteError;
using db::sqlite::Statement;

namespace {

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::vector<std::string> ListTables(SqliteDB& db) {
  std::vector<std::string> names;
  auto st = db.Prepare("SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY rowid;");
  int  rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    names.push_back(ColText(st.get(), 0));
  }
  db.Check(rc, "list tables");
  return names;
}

Table ReadTable(SqliteDB& db, const std::string& name) {
  Table table;
  table.name = name;

  auto st = db.Prepare("SELECT * FROM " + QuoteIdentifier(name) + ";");

  const int column_count = sqlite3_column_count(st.get());
  for (int i = 0; i < column_count; ++i) {
    const char* column = sqlite3_column_name(st.get(), i);
    table.columns.emplace_back(column ? column : "");
  }

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto& row = table.AppendRow();
    for (int i = 0; i < column_count; ++i) {
      row[i] = ColText(st.get(), i);
    }
  }
  db.Check(rc, "read table");
  return table;
}

void WriteTable(SqliteDB& db, const Table& table) {
  std::string ddl = "CREATE TABLE " + QuoteIdentifier(table.name) + " (";
  std::string insert = "INSERT INTO " + QuoteIdentifier(table.name) + " VALUES (";
  for (std::size_t i = 0; i < table.columns.size(); ++i) {
    if (i > 0) {
      ddl += ", ";
      insert += ", ";
    }
    ddl += QuoteIdentifier(table.columns[i]) + " TEXT";
    insert += "?";
  }
  db.Exec(ddl + ");");

  auto st = db.Prepare(insert + ");");
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    db.Check(sqlite3_reset(st.get()), "reset insert");
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
      const auto& cell = table.Cell(r, c);
      db.Check(sqlite3_bind_text(st.get(), static_cast<int>(c + 1), cell.c_str(), static_cast<int>(cell.size()), SQLITE_TRANSIENT), "bind");
    }
    db.Check(sqlite3_step(st.get()), "insert row");
  }
}

} // namespace

db::Result ReadWorkbook(const std::filesystem::path& path, Workbook& out) {
  try {
    SqliteDB db(path.string(), OpenMode::ReadOnly);

    Workbook workbook;
    for (const auto& name : ListTables(db)) {
      workbook.tables.push_back(ReadTable(db, name));
    }
    out = std::move(workbook);
    return db::Result::Ok();
  } catch (const SqliteError& e) {
    return db::sqlite::Translate(e.code(), e.what());
  }
}

db::Result WriteWorkbook(const std::filesystem::path& path, const Workbook& workbook, bool full_sync) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return db::Result::Err(db::ErrorCode::AlreadyExists, path.string() + " already exists");
  }

  for (const auto& table : workbook.tables) {
    if (table.columns.empty()) {
      return db::Result::Err(db::ErrorCode::Unsupported, "table " + table.name + " has no columns");
    }
  }

  try {
    SqliteDB db(path.string(), OpenMode::Create);
    db.ConfigureForWrite(full_sync);

    db.Exec("BEGIN IMMEDIATE;");
    try {
      for (const auto& table : workbook.tables) {
        WriteTable(db, table);
      }
      db.Exec("COMMIT;");
    } catch (const SqliteError&) {
      (void)sqlite3_exec(db.Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
      throw;
    }
    return db::Result::Ok();
  } catch (const SqliteError& e) {
    return db::sqlite::Translate(e.code(), e.what());
  }
}

} // namespace pipeline::db::workbook
