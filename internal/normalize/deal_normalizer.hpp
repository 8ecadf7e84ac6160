#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/context/system_context.hpp"
#include "internal/model/deal.hpp"
#include "internal/model/lookup_tables.hpp"

namespace pipeline::normalize {

struct NormalizationChange {
  std::string field;
  std::string old_value;
  std::string new_value;
  std::string reason;

  bool operator==(const NormalizationChange&) const = default;
};

struct NormalizationResult {
  model::Deal                      deal;
  std::vector<NormalizationChange> changes;

  bool HasChanges() const {
    return !changes.empty();
  }
};

/*
  DealNormalizer

  Canonicalizes a deal and reports every field it touched:

    - missing DealId          -> generated by the context id strategy
    - probability <= 0        -> stage default from the lookup tables
    - postcode present        -> postcode area, and region when unset
    - postcode, no map link   -> Google Maps search link
    - missing created date    -> today from the context clock
    - tags                    -> trimmed, blanks dropped, case-insensitive dedupe

  A change is recorded only when the value actually differs, so a
  normalized deal is a fixed point: a second pass reports nothing.
*/
class DealNormalizer {
 public:
  DealNormalizer(std::shared_ptr<const model::LookupTables> lookups, std::shared_ptr<const context::SystemContext> context);

  model::Deal Normalize(const model::Deal& deal) const;

  NormalizationResult NormalizeWithTracking(const model::Deal& deal) const;

  const model::LookupTables& Lookups() const {
    return *lookups_;
  }

  static std::string BuildMapLink(const model::Deal& deal);

 private:
  std::shared_ptr<const model::LookupTables>    lookups_;
  std::shared_ptr<const context::SystemContext> context_;
};

} // namespace pipeline::normalize
