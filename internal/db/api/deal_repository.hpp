#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/deal_filter.hpp"
#include "internal/model/deal.hpp"

namespace pipeline::db {

/*
  Repository abstraction.

  GUARANTEES (all backends):

  - Every deal handed out is a copy; caller mutation never reaches
    stored state
  - Upsert matches DealId case-insensitively (replace or append)
  - Delete of an unknown id is a no-op
  - Mutations are visible to the next read in the same process;
    durability happens only at SaveChanges

  Store failures are thrown as util:: errors (IntegrityError,
  UnsupportedVersionError, LockTimeoutError).
*/

class DealRepository {
 public:
  virtual ~DealRepository() = default;

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::vector<model::Deal> GetAll() = 0;

  virtual std::optional<model::Deal> GetById(const std::string& deal_id) = 0;

  virtual std::vector<model::Deal> Query(const DealFilter& filter, util::Date reference_date) = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  // Throws std::invalid_argument for a deal without a DealId.
  virtual void Upsert(const model::Deal& deal) = 0;

  virtual void UpsertMany(const std::vector<model::Deal>& deals) = 0;

  virtual void Delete(const std::string& deal_id) = 0;

  virtual void SaveChanges() = 0;
};

} // namespace pipeline::db
