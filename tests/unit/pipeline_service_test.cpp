#include "internal/service/pipeline_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/context/system_context.hpp"
#include "internal/db/memory/memory_deal_repository.hpp"
#include "internal/model/lookup_tables.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using pipeline::context::SystemContext;
using pipeline::db::memory::MemoryDealRepository;
using pipeline::model::Deal;
using pipeline::model::DealStage;
using pipeline::patch::PatchRequest;
using pipeline::patch::PatchStatus;
using pipeline::service::PipelineService;
using pipeline::service::ServiceContext;

constexpr pipeline::util::Date kMarch15{year{2025}, March, day{15}};

struct Fixture {
  std::shared_ptr<MemoryDealRepository> repository = std::make_shared<MemoryDealRepository>();
  std::shared_ptr<PipelineService>      service;

  Fixture() {
    auto ctx     = SystemContext::ForTesting(kMarch15);
    auto lookups = std::make_shared<const pipeline::model::LookupTables>(pipeline::model::LookupTables::CreateDefault());

    ServiceContext services;
    services.context    = ctx;
    services.normalizer = std::make_shared<const pipeline::normalize::DealNormalizer>(lookups, ctx);
    services.repository = repository;
    service             = std::make_shared<PipelineService>(services);
  }
};

Deal NewDeal() {
  Deal deal;
  deal.account_name = "Acme Ltd";
  deal.deal_name    = "Heat pump";
  deal.stage        = DealStage::Proposal;
  deal.postcode     = "SW1A 1AA";
  deal.owner        = "Old Owner";
  return deal;
}

void TestCreateNormalizesAndStores() {
  Fixture f;
  auto    result = f.service->CreateDeal(NewDeal());

  assert(result.deal.deal_id == "D-20250315-00000001");
  assert(result.HasChanges());

  auto stored = f.repository->GetById("d-20250315-00000001");
  assert(stored.has_value());
  assert(stored->region == "London");
  assert(stored->probability == 60);
}

void TestCreateRejectsTakenId() {
  Fixture f;
  auto    created = f.service->CreateDeal(NewDeal());

  Deal duplicate    = NewDeal();
  duplicate.deal_id = created.deal.deal_id;

  bool threw = false;
  try {
    (void)f.service->CreateDeal(duplicate);
  } catch (const pipeline::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // Update is the upsert path.
  duplicate.owner = "Someone Else";
  (void)f.service->UpdateDeal(duplicate);
  assert(f.service->GetDeal(created.deal.deal_id)->owner == "Someone Else");
  assert(f.service->ListDeals().size() == 1);
}

void TestPatchPartialSuccessIsSaved() {
  Fixture f;
  auto    id = f.service->CreateDeal(NewDeal()).deal.deal_id;

  auto result = f.service->PatchDeal(id, PatchRequest{{"Owner", "New Owner"}, {"InvalidField", "x"}, {"Probability", "150"}});

  assert(result.status == PatchStatus::PartiallyApplied);
  assert(!result.success);
  assert(result.deal.has_value());
  assert(result.applied_fields.size() == 1 && result.applied_fields[0].field == "Owner");
  assert(result.rejected_fields.size() == 2);
  assert(result.error == "Partial success: 2 field(s) rejected");

  auto stored = f.service->GetDeal(id);
  assert(stored->owner == "New Owner");
  assert(stored->probability == 60);
}

void TestPatchRebuildsDerivedFields() {
  Fixture f;
  auto    id = f.service->CreateDeal(NewDeal()).deal.deal_id;

  auto result = f.service->PatchDeal(id, PatchRequest{{"Postcode", "EH1 1YZ"}});
  assert(result.status == PatchStatus::Applied);
  assert(result.success);
  assert(result.deal->postcode_area == "EH");
  assert(result.deal->region == "Scotland");
  assert(!result.normalization_changes.empty());
  assert(f.service->GetDeal(id)->region == "Scotland");
}

void TestPatchValidationFailureSavesNothing() {
  Fixture f;
  auto    id     = f.service->CreateDeal(NewDeal()).deal.deal_id;
  auto    before = f.service->GetDeal(id);

  auto result = f.service->PatchDeal(id, PatchRequest{{"Probability", "150"}, {"Region", "Mars"}});
  assert(result.status == PatchStatus::ValidationFailed);
  assert(!result.success);
  assert(!result.deal.has_value());
  assert(result.error == "Validation failed for 2 field(s)");
  assert(f.service->GetDeal(id) == before);
}

void TestPatchMissingDeal() {
  Fixture f;
  auto    result = f.service->PatchDeal("D-MISSING", PatchRequest{{"Owner", "x"}});
  assert(result.status == PatchStatus::NotFound);
  assert(result.error == "Deal not found: D-MISSING");
}

void TestListAndDelete() {
  Fixture f;
  auto    first = f.service->CreateDeal(NewDeal()).deal.deal_id;

  Deal other  = NewDeal();
  other.owner = "Alice";
  (void)f.service->CreateDeal(other);

  pipeline::db::DealFilter filter;
  filter.owner = "alice";
  assert(f.service->ListDeals(filter).size() == 1);
  assert(f.service->ListDeals().size() == 2);

  assert(f.service->DeleteDeal(first));
  assert(!f.service->DeleteDeal(first));
  assert(!f.service->GetDeal(first));
  assert(f.service->ListDeals().size() == 1);
}

} // namespace

int main() {
  TestCreateNormalizesAndStores();
  TestCreateRejectsTakenId();
  TestPatchPartialSuccessIsSaved();
  TestPatchRebuildsDerivedFields();
  TestPatchValidationFailureSavesNothing();
  TestPatchMissingDeal();
  TestListAndDelete();

  std::cout << "pipeline_manager_unit_pipeline_service: pass\n";
  return 0;
}
