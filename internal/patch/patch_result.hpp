#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/deal.hpp"
#include "internal/normalize/deal_normalizer.hpp"

namespace pipeline::patch {

struct AppliedField {
  std::string field;
  std::string old_value;
  std::string new_value;
};

struct RejectedField {
  std::string field;
  std::string attempted_value;
  std::string reason;
};

enum class PatchStatus {
  Applied,
  PartiallyApplied,
  ValidationFailed,
  NotFound,
};

/*
  Outcome of one patch request.

  success is true only when every requested field was applied. A partial
  success still returns the saved deal so callers can show what stuck.
*/
struct PatchResult {
  PatchStatus                                 status  = PatchStatus::NotFound;
  bool                                        success = false;
  std::optional<model::Deal>                  deal;
  std::vector<AppliedField>                   applied_fields;
  std::vector<RejectedField>                  rejected_fields;
  std::vector<normalize::NormalizationChange> normalization_changes;
  std::string                                 error;

  static PatchResult NotFound(const std::string& deal_id) {
    PatchResult result;
    result.status = PatchStatus::NotFound;
    result.error  = "Deal not found: " + deal_id;
    return result;
  }

  static PatchResult ValidationFailed(std::vector<RejectedField> rejected) {
    PatchResult result;
    result.status          = PatchStatus::ValidationFailed;
    result.error           = "Validation failed for " + std::to_string(rejected.size()) + " field(s)";
    result.rejected_fields = std::move(rejected);
    return result;
  }

  static PatchResult Succeeded(model::Deal deal, std::vector<AppliedField> applied, std::vector<RejectedField> rejected,
                               std::vector<normalize::NormalizationChange> changes) {
    PatchResult result;
    result.success = rejected.empty();
    result.status  = result.success ? PatchStatus::Applied : PatchStatus::PartiallyApplied;
    if (!rejected.empty()) {
      result.error = "Partial success: " + std::to_string(rejected.size()) + " field(s) rejected";
    }
    result.deal                  = std::move(deal);
    result.applied_fields        = std::move(applied);
    result.rejected_fields       = std::move(rejected);
    result.normalization_changes = std::move(changes);
    return result;
  }
};

} // namespace pipeline::patch
