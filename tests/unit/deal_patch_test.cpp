#include "internal/patch/deal_patch.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

namespace {

using namespace std::chrono;
using pipeline::model::Deal;
using pipeline::model::DealStage;
using pipeline::patch::DealPatcher;
using pipeline::patch::PatchRequest;

Deal ExistingDeal() {
  Deal deal;
  deal.deal_id       = "D-20250315-00000001";
  deal.account_name  = "Acme Ltd";
  deal.deal_name     = "Heat pump";
  deal.stage         = DealStage::Proposal;
  deal.probability   = 60;
  deal.amount_gbp    = 12000.0;
  deal.owner         = "Old Owner";
  deal.postcode      = "SW1A 1AA";
  deal.postcode_area = "SW";
  deal.region        = "London";
  deal.map_link      = "https://www.google.com/maps/search/?api=1&query=SW1A%201AA";
  return deal;
}

const pipeline::patch::RejectedField* FindRejected(const pipeline::patch::PatchOutcome& outcome, const std::string& field) {
  for (const auto& rejected : outcome.rejected) {
    if (rejected.field == field) return &rejected;
  }
  return nullptr;
}

void TestPartialSuccess() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"Owner", "New Owner"}, {"InvalidField", "x"}, {"Probability", "150"}});

  assert(outcome.applied.size() == 1);
  assert(outcome.applied[0].field == "Owner");
  assert(outcome.applied[0].old_value == "Old Owner");
  assert(outcome.applied[0].new_value == "New Owner");

  assert(outcome.rejected.size() == 2);
  assert(FindRejected(outcome, "InvalidField")->reason == "Unknown field: InvalidField");
  assert(FindRejected(outcome, "Probability")->reason == "Probability must be between 0 and 100");

  assert(deal.owner == "New Owner");
  assert(deal.probability == 60);
}

void TestKeyAndDerivedFieldsAreProtected() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"dealid", "D-OTHER"}, {"Region", "Mars"}, {"WeightedAmountGBP", "1"}, {"MapLink", "x"}});

  assert(outcome.applied.empty());
  assert(outcome.rejected.size() == 4);
  assert(outcome.rejected[0].reason == "DealId is the key and cannot be patched");
  assert(outcome.rejected[1].reason == "Region is a derived field and cannot be patched directly");
  assert(deal == ExistingDeal());
}

void TestFieldNamesMatchCaseInsensitively() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"stage", "closed won"}, {"AMOUNT", "\xC2\xA3" "15,500"}, {"closedate", "20/04/2025"}});

  assert(outcome.rejected.empty());
  assert(outcome.applied.size() == 3);
  assert(outcome.applied[1].field == "AmountGBP");
  assert(deal.stage == DealStage::ClosedWon);
  assert(deal.amount_gbp == 15500.0);
  assert(deal.close_date == (pipeline::util::Date{year{2025}, April, day{20}}));
}

void TestValueValidation() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"Stage", "Signed"},
                                                       {"Probability", "sixty"},
                                                       {"AmountGBP", "-5"},
                                                       {"PromoterCommission", "abc"},
                                                       {"NextStepDueDate", "next week"},
                                                       {"CommissionPaid", "maybe"}});

  assert(outcome.applied.empty());
  assert(FindRejected(outcome, "Stage")->reason == "Unknown stage: Signed");
  assert(FindRejected(outcome, "Probability")->reason == "Invalid probability value");
  assert(FindRejected(outcome, "AmountGBP")->reason == "Amount cannot be negative");
  assert(FindRejected(outcome, "PromoterCommission")->reason == "Invalid commission value");
  assert(FindRejected(outcome, "NextStepDueDate")->reason == "Invalid date format");
  assert(FindRejected(outcome, "CommissionPaid")->reason == "Invalid boolean value for CommissionPaid");
  assert(deal == ExistingDeal());
}

void TestNullClearsOptionalFieldsOnly() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"AmountGBP", std::nullopt}, {"Owner", std::nullopt}, {"AccountName", std::nullopt}, {"Stage", std::nullopt}});

  assert(outcome.applied.size() == 2);
  assert(!deal.amount_gbp);
  assert(deal.owner.empty());

  assert(outcome.rejected.size() == 2);
  assert(FindRejected(outcome, "AccountName")->reason == "AccountName is required and cannot be cleared");
  assert(FindRejected(outcome, "Stage")->reason == "Stage is required and cannot be cleared");
  assert(deal.account_name == "Acme Ltd");
}

void TestFlagsAndTags() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"CommissionPaid", "YES"}, {"Tags", "solar, urgent ,,"}});

  assert(outcome.rejected.empty());
  assert(deal.commission_paid);
  assert((deal.tags == std::vector<std::string>{"solar", "urgent"}));
}

void TestTextIsTrimmedAndTagsUseListSeparators() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"Owner", " Alice "}, {"Tags", "R&D;Solar | hot"}});

  assert(outcome.rejected.empty());
  assert(deal.owner == "Alice");
  assert((deal.tags == std::vector<std::string>{"R&D", "Solar", "hot"}));
}

void TestPostcodeChangeResetsDerivedFields() {
  Deal deal    = ExistingDeal();
  auto outcome = DealPatcher::Apply(deal, PatchRequest{{"Postcode", "EH1 1YZ"}});

  assert(outcome.applied.size() == 1);
  assert(deal.postcode == "EH1 1YZ");
  assert(deal.postcode_area.empty());
  assert(deal.region.empty());
  assert(deal.map_link.empty());

  // Same value again changes nothing derived.
  Deal same = ExistingDeal();
  DealPatcher::Apply(same, PatchRequest{{"Postcode", "SW1A 1AA"}});
  assert(same.region == "London");
}

void TestWhitelist() {
  assert(DealPatcher::IsPatchable("owner"));
  assert(DealPatcher::IsPatchable("Amount"));
  assert(!DealPatcher::IsPatchable("DealId"));
  assert(!DealPatcher::IsPatchable("Region"));

  auto fields = DealPatcher::PatchableFields();
  assert(!fields.empty());
  for (auto name : fields) assert(name != "DealId");
}

} // namespace

int main() {
  TestPartialSuccess();
  TestKeyAndDerivedFieldsAreProtected();
  TestFieldNamesMatchCaseInsensitively();
  TestValueValidation();
  TestNullClearsOptionalFieldsOnly();
  TestFlagsAndTags();
  TestTextIsTrimmedAndTagsUseListSeparators();
  TestPostcodeChangeResetsDerivedFields();
  TestWhitelist();

  std::cout << "pipeline_manager_unit_deal_patch: pass\n";
  return 0;
}
