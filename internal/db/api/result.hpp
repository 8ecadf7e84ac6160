#pragma once

#include <string>

namespace pipeline::db {

/*
  Outcome of a container read or write.

  Container I/O maps sqlite return codes onto these. Only the workbook
  store layer turns them into util:: exceptions; nothing above it sees
  a Result.
*/

enum class ErrorCode {
  OK = 0,

  AlreadyExists, // write target exists; writes never overwrite in place
  Busy,          // another connection holds the container

  IOError,
  Corruption,
  NotADatabase, // file is not a container at all

  Unsupported, // table shape the container format cannot hold
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::AlreadyExists:
      return "already-exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::IOError:
      return "io-error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::NotADatabase:
      return "not-a-database";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  // The file exists but its contents cannot be trusted.
  bool IsDamaged() const {
    return code == ErrorCode::Corruption || code == ErrorCode::NotADatabase;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace pipeline::db
