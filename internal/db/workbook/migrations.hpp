#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/db/workbook/workbook.hpp"

namespace pipeline::db::workbook {

/*
  One named transition between consecutive layout versions.

  Transitions run on the generic table model, are idempotent and only
  ever add: unknown tables and columns pass through untouched.
*/
struct Migration {
  std::string                    from;
  std::string                    to;
  std::string                    name;
  std::function<void(Workbook&)> apply;
};

/*
  Version state machine: 1.0 -> 1.1 -> 1.2.

  A version with no outgoing transition that is not the target is a
  dead end and Migrate refuses it with UnsupportedVersionError.
*/
class MigrationChain {
 public:
  static MigrationChain Default();

  void Register(Migration migration);

  bool HasPath(const std::string& from, const std::string& to) const;

  // Runs every step from -> to. Returns the names of the steps applied.
  std::vector<std::string> Migrate(Workbook& workbook, const std::string& from, const std::string& to) const;

  const std::vector<Migration>& Steps() const {
    return steps_;
  }

 private:
  const Migration* Next(const std::string& from) const;

  std::vector<Migration> steps_;
};

} // namespace pipeline::db::workbook
