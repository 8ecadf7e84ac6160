#include "pipeline_service.hpp"

#include <stdexcept>

#include "internal/context/system_context.hpp"
#include "internal/db/api/deal_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace pipeline::service {

PipelineService::PipelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.context || !ctx_.normalizer || !ctx_.repository) {
    throw std::invalid_argument("PipelineService requires context, normalizer and repository");
  }
}

std::optional<model::Deal> PipelineService::GetDeal(const std::string& deal_id) {
  return ctx_.repository->GetById(deal_id);
}

std::vector<model::Deal> PipelineService::ListDeals(const db::DealFilter& filter, std::optional<util::Date> reference_date) {
  if (filter.IsEmpty()) {
    return ctx_.repository->GetAll();
  }
  return ctx_.repository->Query(filter, reference_date.value_or(ctx_.context->Today()));
}

normalize::NormalizationResult PipelineService::Store(const model::Deal& deal) {
  auto result = ctx_.normalizer->NormalizeWithTracking(deal);
  ctx_.repository->Upsert(result.deal);
  ctx_.repository->SaveChanges();
  return result;
}

normalize::NormalizationResult PipelineService::CreateDeal(const model::Deal& deal) {
  if (!deal.deal_id.empty() && ctx_.repository->GetById(deal.deal_id)) {
    throw util::InvalidState("Deal already exists: " + deal.deal_id);
  }

  auto result = Store(deal);
  PIPELINE_LOG_INFO("Deal created", {observability::StringField("deal_id", result.deal.deal_id),
                                     observability::AmountField("amount_gbp", result.deal.amount_gbp),
                                     observability::IntField("normalized", static_cast<int64_t>(result.changes.size()))});
  return result;
}

normalize::NormalizationResult PipelineService::UpdateDeal(const model::Deal& deal) {
  return Store(deal);
}

bool PipelineService::DeleteDeal(const std::string& deal_id) {
  if (!ctx_.repository->GetById(deal_id)) {
    return false;
  }

  ctx_.repository->Delete(deal_id);
  ctx_.repository->SaveChanges();
  PIPELINE_LOG_INFO("Deal deleted", {observability::StringField("deal_id", deal_id)});
  return true;
}

patch::PatchResult PipelineService::PatchDeal(const std::string& deal_id, const patch::PatchRequest& request) {
  auto deal = ctx_.repository->GetById(deal_id);
  if (!deal) {
    return patch::PatchResult::NotFound(deal_id);
  }

  auto outcome = patch::DealPatcher::Apply(*deal, request);

  if (outcome.applied.empty() && !outcome.rejected.empty()) {
    PIPELINE_LOG_WARN("Patch rejected", {observability::StringField("deal_id", deal_id),
                                         observability::IntField("rejected", static_cast<int64_t>(outcome.rejected.size()))});
    return patch::PatchResult::ValidationFailed(std::move(outcome.rejected));
  }

  auto normalized = Store(*deal);

  if (!outcome.rejected.empty()) {
    PIPELINE_LOG_WARN("Patch partially applied", {observability::StringField("deal_id", deal_id),
                                                  observability::IntField("applied", static_cast<int64_t>(outcome.applied.size())),
                                                  observability::IntField("rejected", static_cast<int64_t>(outcome.rejected.size()))});
  }

  return patch::PatchResult::Succeeded(std::move(normalized.deal), std::move(outcome.applied), std::move(outcome.rejected),
                                       std::move(normalized.changes));
}

} // namespace pipeline::service
