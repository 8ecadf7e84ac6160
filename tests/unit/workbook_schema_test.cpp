#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/db/workbook/layout_codec.hpp"
#include "internal/db/workbook/migrations.hpp"
#include "internal/db/workbook/workbook.hpp"
#include "internal/db/workbook/workbook_io.hpp"
#include "internal/db/workbook/workbook_schema.hpp"
#include "internal/model/deal.hpp"
#include "internal/model/lookup_tables.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono;
using namespace pipeline::db::workbook;
using pipeline::model::Deal;
using pipeline::model::DealStage;
using pipeline::model::LookupTables;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "pipeline_manager_workbook_schema_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

MetadataStamp Stamp() {
  return {sys_days{year{2025} / March / day{15}} + hours{9}, "pipeline-manager-test"};
}

Deal SampleDeal(const std::string& id) {
  Deal deal;
  deal.deal_id      = id;
  deal.account_name = "Acme Ltd";
  deal.deal_name    = "Heat pump install";
  deal.stage        = DealStage::Proposal;
  deal.probability  = 60;
  deal.amount_gbp   = 12000.5;
  deal.postcode     = "SW1A 1AA";
  deal.close_date   = year{2025} / June / day{30};
  deal.tags         = {"hot", "referral"};
  return deal;
}

Workbook MinimalWorkbook(std::vector<std::string> columns) {
  Workbook workbook;
  workbook.AddTable(std::string(kDealsTable), std::move(columns));
  return workbook;
}

void TestMissingDealsTableIsInvalid() {
  Workbook workbook;
  workbook.AddTable("Other", {"A"});

  const auto result = ValidateWorkbook(workbook, SchemaPolicy{});
  assert(!result.valid);
  assert(!result.has_deals_table);
  assert(result.errors.size() == 1);
  assert(result.errors[0] == "Missing required table: Deals");
  assert(result.warnings.size() == 2);
}

void TestMissingRequiredColumnIsReported() {
  const auto workbook = MinimalWorkbook({"DealId", "AccountName", "DealName"});

  const auto result = ValidateWorkbook(workbook, SchemaPolicy{});
  assert(!result.valid);
  assert(result.errors.size() == 1);
  assert(result.errors[0] == "Missing required column: Stage");
}

void TestHeaderMatchingIgnoresCaseSpacesAndUnderscores() {
  auto workbook = MinimalWorkbook({"deal id", "ACCOUNT_NAME", "Deal_Name", " stage "});
  auto& deals   = *workbook.FindTable(kDealsTable);
  deals.AppendRow() = {"D-1", "Acme", "Pump", "Lead"};
  deals.AppendRow();
  deals.AppendRow() = {"D-2", "Beta", "Boiler", "Won"};

  const auto result = ValidateWorkbook(workbook, SchemaPolicy{});
  assert(result.valid);
  assert(result.errors.empty());
  assert(result.deal_count == 2);
  assert(result.has_deals_table);
  assert(!result.has_lookups_table);
  assert(!result.has_metadata_table);
}

void TestVersionDetection() {
  auto workbook = MinimalWorkbook(RequiredDealColumns());
  assert(DetectVersion(workbook) == "1.0");

  Table& metadata = workbook.AddTable(std::string(kMetadataTable), {"Property", "Value"});
  assert(DetectVersion(workbook) == "1.0");

  SetMetadataValue(metadata, "Version", "1.1");
  assert(DetectVersion(workbook) == "1.1");

  const auto result = ValidateWorkbook(workbook, SchemaPolicy{});
  assert(result.valid);
  assert(result.detected_version == "1.1");
  assert(result.version_supported);
  assert(result.migration_required);

  SetMetadataValue(metadata, "Version", "9.9");
  const auto future = ValidateWorkbook(workbook, SchemaPolicy{});
  assert(future.valid);
  assert(!future.version_supported);
  assert(!future.migration_required);
}

void TestMigrationChainReachesCurrentVersion() {
  auto workbook = MinimalWorkbook(RequiredDealColumns());
  workbook.AddTable("Scratch", {"Anything"}).AppendRow() = {"kept"};

  const auto chain   = MigrationChain::Default();
  const auto applied = chain.Migrate(workbook, "1.0", "1.2");
  assert(applied.size() == 2);
  assert(applied[0] == "add_metadata_version_stamp");
  assert(applied[1] == "bump_metadata_version");
  assert(DetectVersion(workbook) == "1.2");

  const Table* scratch = workbook.FindTable("Scratch");
  assert(scratch);
  assert(scratch->Cell(0, 0) == "kept");

  assert(chain.Migrate(workbook, "1.2", "1.2").empty());
}

void TestMigrationStepsAreIdempotent() {
  const auto chain = MigrationChain::Default();
  for (const auto& step : chain.Steps()) {
    auto workbook = MinimalWorkbook(RequiredDealColumns());
    step.apply(workbook);
    const auto once = workbook;
    step.apply(workbook);
    assert(workbook == once);
  }
}

void TestMigrationRefusesUnknownVersions() {
  const auto chain = MigrationChain::Default();
  assert(chain.HasPath("1.0", "1.2"));
  assert(chain.HasPath("1.1", "1.2"));
  assert(!chain.HasPath("0.9", "1.2"));
  assert(!chain.HasPath("1.2", "1.0"));

  for (const std::string version : {"0.9", "9.9"}) {
    auto       workbook = MinimalWorkbook(RequiredDealColumns());
    const auto before   = workbook;
    bool       refused  = false;
    try {
      chain.Migrate(workbook, version, "1.2");
    } catch (const pipeline::util::UnsupportedVersionError& e) {
      refused = e.version() == version;
    }
    assert(refused);
    assert(workbook == before);
  }
}

void TestEncodersDifferOnlyInMetadata() {
  const std::vector<Deal> deals = {SampleDeal("D-1"), SampleDeal("D-2")};
  const auto              lookups = LookupTables::CreateDefault();

  const auto legacy = EncoderFor("1.0").Encode(deals, lookups, Stamp());
  assert(legacy.FindTable(kDealsTable));
  assert(legacy.FindTable(kLookupsTable));
  assert(!legacy.FindTable(kMetadataTable));
  assert(DetectVersion(legacy) == "1.0");

  const auto middle = EncoderFor("1.1").Encode(deals, lookups, Stamp());
  const auto* meta  = middle.FindTable(kMetadataTable);
  assert(meta);
  assert(GetMetadataValue(*meta, "Version") == "1.1");
  assert(GetMetadataValue(*meta, "DealCount") == "2");
  assert(GetMetadataValue(*meta, "LastModified").has_value());
  assert(!GetMetadataValue(*meta, "GeneratedBy"));

  const auto current = EncoderFor("1.2").Encode(deals, lookups, Stamp());
  meta               = current.FindTable(kMetadataTable);
  assert(meta);
  assert(GetMetadataValue(*meta, "Version") == "1.2");
  assert(GetMetadataValue(*meta, "GeneratedBy") == "pipeline-manager-test");

  const Table& written = *current.FindTable(kDealsTable);
  assert(written.columns == DealColumns());
  assert(written.rows.size() == 2);
  const auto weighted = written.ColumnIndex("WeightedAmountGBP");
  assert(weighted);
  assert(written.Cell(0, *weighted) == "7200.3");

  bool refused = false;
  try {
    (void)EncoderFor("2.0");
  } catch (const pipeline::util::UnsupportedVersionError& e) {
    refused = e.version() == "2.0";
  }
  assert(refused);
}

void TestDecodeAcceptsAliasesAndKeepsExtraColumns() {
  auto  workbook = MinimalWorkbook({"ID", "Company", "Opportunity", "Stage", "Prob", "Value", "Tags", "Colour", "Legacy Ref"});
  auto& deals    = *workbook.FindTable(kDealsTable);
  deals.AppendRow() = {"D-1", " Acme ", "Pump", "closed won", "75%", "£1,250.50", "a; b | c", "Red", ""};
  deals.AppendRow();
  deals.AppendRow() = {"D-2", "", "", "mystery", "", "", "", "", "R-9"};

  const auto decoded = DecodeDeals(workbook);
  assert(decoded.size() == 2);

  const auto& first = decoded[0];
  assert(first.deal_id == "D-1");
  assert(first.account_name == "Acme");
  assert(first.deal_name == "Pump");
  assert(first.stage == DealStage::ClosedWon);
  assert(first.probability == 75);
  assert(first.amount_gbp == 1250.5);
  assert((first.tags == std::vector<std::string>{"a", "b", "c"}));
  assert(first.extra_columns.size() == 1);
  assert(first.extra_columns[0].first == "Colour");
  assert(first.extra_columns[0].second == "Red");

  const auto& second = decoded[1];
  assert(second.account_name == "Unknown");
  assert(second.deal_name == "Unnamed Deal");
  assert(second.stage == DealStage::Other);
  assert(!second.amount_gbp);
  assert(second.extra_columns.size() == 1);
  assert(second.extra_columns[0].first == "Legacy Ref");
}

void TestExtraColumnsSurviveEncoding() {
  auto first = SampleDeal("D-1");
  first.extra_columns = {{"Colour", "Red"}};
  auto second = SampleDeal("D-2");
  second.extra_columns = {{"colour", "Blue"}, {"Legacy Ref", "R-9"}};

  const auto workbook = EncoderFor("1.2").Encode({first, second}, LookupTables::CreateDefault(), Stamp());
  const auto decoded  = DecodeDeals(workbook);
  assert(decoded.size() == 2);
  assert(decoded[0] == first);
  assert(decoded[1].extra_columns.size() == 2);
  assert(decoded[1].extra_columns[0].first == "Colour");
  assert(decoded[1].extra_columns[0].second == "Blue");
  assert(decoded[1].extra_columns[1].second == "R-9");
}

void TestLookupsAreLayeredOverDefaults() {
  Workbook workbook;
  auto&    lookups = workbook.AddTable(std::string(kLookupsTable), {"PostcodeArea", "Region", "Stage", "DefaultProbability"});
  lookups.AppendRow() = {"ZZ", "Nowhere", "Proposal", "55"};

  const auto decoded = DecodeLookups(workbook);
  assert(decoded);
  assert(decoded->RegionForArea("zz") == "Nowhere");
  assert(decoded->ProbabilityForStage(DealStage::Proposal) == 55);
  assert(decoded->RegionForArea("SW") == LookupTables::CreateDefault().RegionForArea("SW"));

  assert(!DecodeLookups(MinimalWorkbook(RequiredDealColumns())));
}

void TestLegacyWorkbookDecodesThroughMigrations() {
  const std::vector<Deal> deals = {SampleDeal("D-1")};
  const auto legacy = EncoderFor("1.0").Encode(deals, LookupTables::CreateDefault(), Stamp());

  const auto decoded = DecodeWorkbook(legacy, MigrationChain::Default(), "1.2");
  assert(decoded.source_version == "1.0");
  assert(decoded.migrations_applied.size() == 2);
  assert(decoded.deals == deals);
  assert(decoded.lookups);
}

void TestFileRoundTripAndRefusals() {
  const auto dir  = FreshDir("file");
  const auto path = dir / "deals.db";

  const auto workbook = EncoderFor("1.2").Encode({SampleDeal("D-1")}, LookupTables::CreateDefault(), Stamp());
  auto       rc       = WriteWorkbook(path, workbook, false);
  assert(rc);

  Workbook read;
  rc = ReadWorkbook(path, read);
  assert(rc);
  assert(read == workbook);

  rc = WriteWorkbook(path, workbook, false);
  assert(!rc);
  assert(rc.code == pipeline::db::ErrorCode::AlreadyExists);
  assert(!rc.IsDamaged());
  assert(std::string(pipeline::db::ErrorCodeName(rc.code)) == "already-exists");

  Workbook out;
  const auto result = ValidateWorkbookFile(path, SchemaPolicy{}, &out);
  assert(result.valid);
  assert(result.deal_count == 1);
  assert(result.detected_version == "1.2");
  assert(!result.migration_required);
  assert(out == workbook);

  const auto garbage = dir / "garbage.db";
  {
    std::ofstream file(garbage, std::ios::binary);
    file << std::string(4096, 'x');
  }
  const auto bad = ValidateWorkbookFile(garbage, SchemaPolicy{});
  assert(!bad.valid);
  assert(!bad.errors.empty());

  Workbook unread;
  const auto damaged = ReadWorkbook(garbage, unread);
  assert(!damaged);
  assert(damaged.IsDamaged());

  const auto missing = ValidateWorkbookFile(dir / "missing.db", SchemaPolicy{});
  assert(!missing.valid);
}

} // namespace

int main() {
  TestMissingDealsTableIsInvalid();
  TestMissingRequiredColumnIsReported();
  TestHeaderMatchingIgnoresCaseSpacesAndUnderscores();
  TestVersionDetection();
  TestMigrationChainReachesCurrentVersion();
  TestMigrationStepsAreIdempotent();
  TestMigrationRefusesUnknownVersions();
  TestEncodersDifferOnlyInMetadata();
  TestDecodeAcceptsAliasesAndKeepsExtraColumns();
  TestExtraColumnsSurviveEncoding();
  TestLookupsAreLayeredOverDefaults();
  TestLegacyWorkbookDecodesThroughMigrations();
  TestFileRoundTripAndRefusals();

  std::cout << "pipeline_manager_unit_workbook_schema: pass\n";
  return 0;
}
