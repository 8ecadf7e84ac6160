#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/deal_filter.hpp"
#include "internal/model/deal.hpp"
#include "internal/normalize/deal_normalizer.hpp"
#include "internal/patch/deal_patch.hpp"
#include "internal/patch/patch_result.hpp"
#include "service_context.hpp"

namespace pipeline::service {

/*
  PipelineService

  Deal operations on top of a repository. Every write normalizes the
  deal, stores it and commits before returning.
*/
class PipelineService {
public:
  explicit PipelineService(ServiceContext ctx);

  std::optional<model::Deal> GetDeal(const std::string& deal_id);

  // Reference date defaults to today from the context clock.
  std::vector<model::Deal> ListDeals(const db::DealFilter& filter = {}, std::optional<util::Date> reference_date = std::nullopt);

  // Throws util::InvalidState when the DealId is already taken.
  normalize::NormalizationResult CreateDeal(const model::Deal& deal);

  // Insert or replace.
  normalize::NormalizationResult UpdateDeal(const model::Deal& deal);

  // Returns false when no such deal existed.
  bool DeleteDeal(const std::string& deal_id);

  patch::PatchResult PatchDeal(const std::string& deal_id, const patch::PatchRequest& request);

private:
  normalize::NormalizationResult Store(const model::Deal& deal);

  ServiceContext ctx_;
};

}
