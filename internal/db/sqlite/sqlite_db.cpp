#include "sqlite_db.hpp"

namespace pipeline::db::sqlite {

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)) {
  const int flags = mode == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, path_ + ": " + msg);
  }

  // wait briefly for a concurrent reader/writer instead of failing immediately
  Check(sqlite3_busy_timeout(db_, 5000), "busy_timeout");
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw SqliteError(rc, msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt);
  Check(rc, "sqlite prepare");
  return owned;
}

void SqliteDB::Check(int rc, const char* what) {
  if (rc != SQLITE_OK && rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw SqliteError(rc, std::string(what) + ": " + sqlite3_errmsg(db_));
  }
}

void SqliteDB::ConfigureForWrite(bool full_sync) {
  Exec("PRAGMA journal_mode=DELETE;");
  Exec(full_sync ? "PRAGMA synchronous=FULL;" : "PRAGMA synchronous=NORMAL;");
}

std::string QuoteIdentifier(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

db::Result Translate(int rc, const std::string& message) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return db::Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return db::Result::Err(db::ErrorCode::Busy, message);
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
    case SQLITE_READONLY:
    case SQLITE_PERM:
      return db::Result::Err(db::ErrorCode::IOError, message);
    case SQLITE_CORRUPT:
      return db::Result::Err(db::ErrorCode::Corruption, message);
    case SQLITE_NOTADB:
      return db::Result::Err(db::ErrorCode::NotADatabase, message);
    default:
      return db::Result::Err(db::ErrorCode::InternalError, message);
  }
}

} // namespace pipeline::db::sqlite
