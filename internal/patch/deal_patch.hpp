#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/deal.hpp"
#include "internal/patch/patch_result.hpp"

namespace pipeline::patch {

// nullopt is an explicit null: clear the field.
using FieldValue   = std::optional<std::string>;
using PatchRequest = std::vector<std::pair<std::string, FieldValue>>;

struct PatchOutcome {
  std::vector<AppliedField>  applied;
  std::vector<RejectedField> rejected;
};

/*
  DealPatcher

  Applies a field-name -> value request to a deal through a fixed
  whitelist. Field names match case-insensitively ("Amount" is accepted
  for AmountGBP). DealId and the derived fields are never patchable.

  Each field is parsed and validated on its own: valid fields are
  applied in request order, invalid ones are returned with a reason.
  Changing the postcode or installation location clears the fields
  derived from them so the next normalization pass rebuilds them.
*/
class DealPatcher {
 public:
  static PatchOutcome Apply(model::Deal& deal, const PatchRequest& request);

  static bool IsPatchable(std::string_view field);

  // Canonical names of every patchable field.
  static std::vector<std::string_view> PatchableFields();
};

} // namespace pipeline::patch
