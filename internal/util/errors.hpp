#pragma once

#include <stdexcept>
#include <string>

namespace pipeline::util {

/*
  Central error types.

  Store-level failures abort the whole operation. Per-field patch
  rejections and missing deals are reported as data, never thrown.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Durable file failed structural validation and could not be restored.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnsupportedVersionError : public std::runtime_error {
 public:
  UnsupportedVersionError(const std::string& version, const std::string& msg) : std::runtime_error(msg), version_(version) {
  }

  const std::string& version() const {
    return version_;
  }

 private:
  std::string version_;
};

class LockTimeoutError : public std::runtime_error {
 public:
  LockTimeoutError(const std::string& lock_path, const std::string& msg) : std::runtime_error(msg), lock_path_(lock_path) {
  }

  const std::string& lock_path() const {
    return lock_path_;
  }

 private:
  std::string lock_path_;
};

} // namespace pipeline::util
