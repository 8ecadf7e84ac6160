#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace pipeline::db::sqlite {

/*
  Error raised by SqliteDB. Carries the primary sqlite result code so
  callers can translate it into a portable db::Result.
*/
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int code() const {
    return code_;
  }

 private:
  int code_;
};

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

enum class OpenMode {
  ReadOnly,
  Create,
};

/*
  Thin RAII wrapper around sqlite3*.

  The durable file is a plain sqlite database used as a container of
  text tables. Readers open it read-only; writers only ever create a
  fresh temp file, so no WAL or shared-cache setup is needed.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, OpenMode mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, DDL, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Throws SqliteError unless rc is OK/ROW/DONE.
  void Check(int rc, const char* what);

  // Rollback journal + full sync: the file is complete once COMMIT returns.
  void ConfigureForWrite(bool full_sync);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Double-quoted identifier with embedded quotes doubled.
std::string QuoteIdentifier(const std::string& name);

db::Result Translate(int rc, const std::string& message);

} // namespace pipeline::db::sqlite
