#include "internal/model/deal.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/lookup_tables.hpp"
#include "internal/util/time.hpp"

namespace {

using pipeline::model::DealStage;
using pipeline::model::LookupTables;

void TestStageParsing() {
  using pipeline::model::ParseStage;
  using pipeline::model::TryParseStage;

  assert(TryParseStage("Closed Won") == DealStage::ClosedWon);
  assert(TryParseStage("closed-won") == DealStage::ClosedWon);
  assert(TryParseStage("CLOSED_LOST") == DealStage::ClosedLost);
  assert(TryParseStage("won") == DealStage::ClosedWon);
  assert(TryParseStage("On Hold") == DealStage::OnHold);
  assert(TryParseStage(" proposal ") == DealStage::Proposal);
  assert(!TryParseStage("Signed"));
  assert(!TryParseStage(""));

  assert(ParseStage("") == DealStage::Lead);
  assert(ParseStage("Signed") == DealStage::Other);
  assert(ParseStage("Negotiation") == DealStage::Negotiation);

  assert(pipeline::model::StageName(DealStage::ClosedWon) == "Closed Won");
  assert(pipeline::model::StageName(DealStage::OnHold) == "On Hold");
}

void TestStageDefaults() {
  assert(pipeline::model::DefaultProbability(DealStage::Lead) == 10);
  assert(pipeline::model::DefaultProbability(DealStage::Proposal) == 60);
  assert(pipeline::model::DefaultProbability(DealStage::ClosedWon) == 100);
  assert(pipeline::model::DefaultProbability(DealStage::ClosedLost) == 0);
  assert(pipeline::model::IsClosed(DealStage::ClosedLost));
  assert(!pipeline::model::IsClosed(DealStage::OnHold));
}

void TestValueParsing() {
  using pipeline::model::ParseAmount;
  using pipeline::model::ParseFlag;

  assert(ParseAmount("\xC2\xA3" "1,250.50") == 1250.5);
  assert(ParseAmount("$99") == 99.0);
  assert(ParseAmount("1 000") == 1000.0);
  assert(!ParseAmount("lots"));
  assert(!ParseAmount(""));

  assert(pipeline::model::ParsePercent("60%") == 60);
  assert(!pipeline::model::ParsePercent("sixty"));

  assert(ParseFlag("Yes") == true);
  assert(ParseFlag("0") == false);
  assert(ParseFlag("FALSE") == false);
  assert(!ParseFlag("maybe"));

  auto tags = pipeline::model::ParseTagList(" hot; solar |  ,urgent ");
  assert(tags.size() == 3);
  assert(tags[0] == "hot" && tags[1] == "solar" && tags[2] == "urgent");
  assert(pipeline::model::FormatTagList(tags) == "hot, solar, urgent");
}

void TestWeightedAmount() {
  pipeline::model::Deal deal;
  assert(!deal.WeightedAmountGbp());

  deal.amount_gbp  = 10000.0;
  deal.probability = 60;
  assert(deal.WeightedAmountGbp() == 6000.0);
}

void TestDealIdsMatchCaseInsensitively() {
  assert(pipeline::model::SameDealId("d-20250315-abc", "D-20250315-ABC"));
  assert(!pipeline::model::SameDealId("D-1", "D-2"));
}

void TestLookupTables() {
  auto lookups = LookupTables::CreateDefault();

  assert(LookupTables::ExtractPostcodeArea("sw1a 1aa") == "SW");
  assert(LookupTables::ExtractPostcodeArea(" B33 8TH") == "B");
  assert(LookupTables::ExtractPostcodeArea("123") == "");

  assert(lookups.RegionForPostcode("SW1A 1AA") == std::string("London"));
  assert(lookups.RegionForPostcode("EH1 1YZ") == std::string("Scotland"));
  assert(lookups.RegionForArea("bt") == std::string("Northern Ireland"));
  assert(!lookups.RegionForPostcode("ZZ1 1ZZ"));
  assert(!lookups.RegionForPostcode(""));

  assert(lookups.ProbabilityForStage(DealStage::Discovery) == 40);

  lookups.SetStageProbability(DealStage::Discovery, 35);
  lookups.SetRegion("zz", "Nowhere");
  assert(lookups.ProbabilityForStage(DealStage::Discovery) == 35);
  assert(lookups.RegionForPostcode("ZZ1 1ZZ") == std::string("Nowhere"));
}

void TestDateParsing() {
  using namespace std::chrono;
  using pipeline::util::Date;
  using pipeline::util::ParseDate;

  const Date expected{year{2025}, March, day{5}};
  assert(ParseDate("2025-03-05") == expected);
  assert(ParseDate("2025-03-05T10:30:00") == expected);
  assert(ParseDate("2025/03/05") == expected);
  assert(ParseDate("05/03/2025") == expected);
  assert(ParseDate("5/3/2025") == expected);
  assert(ParseDate("05-03-2025") == expected);
  assert(ParseDate("5-3-2025") == expected);
  assert(!ParseDate("2025-02-30"));
  assert(!ParseDate("tomorrow"));

  assert(pipeline::util::FormatDate(expected) == "2025-03-05");
  assert(pipeline::util::FormatCompactDate(expected) == "20250305");
}

} // namespace

int main() {
  TestStageParsing();
  TestStageDefaults();
  TestValueParsing();
  TestWeightedAmount();
  TestDealIdsMatchCaseInsensitively();
  TestLookupTables();
  TestDateParsing();

  std::cout << "pipeline_manager_unit_deal_model: pass\n";
  return 0;
}
