#include "layout_codec.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <map>
#include <set>

#include "internal/db/workbook/workbook_schema.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace pipeline::db::workbook {

namespace {

using model::Deal;

// ------------------------------------------------------------
// Deals header aliases (first entry is the written header)
// ------------------------------------------------------------

using Aliases = std::initializer_list<std::string_view>;

const Aliases kDealId               = {"DealId", "ID"};
const Aliases kOrderNo              = {"OrderNo", "OrderNumber"};
const Aliases kUserId               = {"UserId"};
const Aliases kAccountName          = {"AccountName", "Account", "Company"};
const Aliases kContactName          = {"ContactName", "Contact"};
const Aliases kEmail                = {"Email", "E-mail"};
const Aliases kPhone                = {"Phone", "Telephone", "Tel"};
const Aliases kPostcode             = {"Postcode", "Zip"};
const Aliases kPostcodeArea         = {"PostcodeArea"};
const Aliases kInstallationLocation = {"InstallationLocation", "Address"};
const Aliases kRegion               = {"Region"};
const Aliases kMapLink              = {"MapLink", "Map"};
const Aliases kLeadSource           = {"LeadSource", "Source"};
const Aliases kProductLine          = {"ProductLine", "Product"};
const Aliases kDealName             = {"DealName", "Deal", "Opportunity"};
const Aliases kStage                = {"Stage"};
const Aliases kProbability          = {"Probability", "Prob"};
const Aliases kAmount               = {"AmountGBP", "Amount", "Value"};
const Aliases kWeightedAmount       = {"WeightedAmountGBP"};
const Aliases kOwner                = {"Owner", "SalesRep", "Rep"};
const Aliases kCreatedDate          = {"CreatedDate", "Created"};
const Aliases kLastContactedDate    = {"LastContactedDate", "LastContact"};
const Aliases kNextStep             = {"NextStep"};
const Aliases kNextStepDueDate      = {"NextStepDueDate", "NextStepDue"};
const Aliases kCloseDate            = {"CloseDate", "ExpectedClose"};
const Aliases kServicePlan          = {"ServicePlan"};
const Aliases kLastServiceDate      = {"LastServiceDate"};
const Aliases kNextServiceDueDate   = {"NextServiceDueDate"};
const Aliases kComments             = {"Comments", "Notes"};
const Aliases kTags                 = {"Tags"};
const Aliases kPromoterId           = {"PromoterId"};
const Aliases kPromoCode            = {"PromoCode"};
const Aliases kPromoterCommission   = {"PromoterCommission", "Commission"};
const Aliases kCommissionPaid       = {"CommissionPaid"};
const Aliases kCommissionPaidDate   = {"CommissionPaidDate"};

const std::vector<Aliases>& AllDealAliases() {
  static const std::vector<Aliases> kAll = {
      kDealId,       kOrderNo,     kUserId,      kAccountName,     kContactName,         kEmail,           kPhone,
      kPostcode,     kPostcodeArea, kInstallationLocation, kRegion,  kMapLink,             kLeadSource,      kProductLine,
      kDealName,     kStage,       kProbability, kAmount,          kWeightedAmount,      kOwner,           kCreatedDate,
      kLastContactedDate, kNextStep, kNextStepDueDate, kCloseDate, kServicePlan,         kLastServiceDate, kNextServiceDueDate,
      kComments,     kTags,        kPromoterId,  kPromoCode,       kPromoterCommission,  kCommissionPaid,  kCommissionPaidDate,
  };
  return kAll;
}

const std::set<std::string>& RecognizedHeaderKeys() {
  static const std::set<std::string> kKeys = [] {
    std::set<std::string> keys;
    for (const auto& aliases : AllDealAliases()) {
      for (auto alias : aliases) keys.insert(HeaderKey(alias));
    }
    return keys;
  }();
  return kKeys;
}

std::string FormatOptionalDate(const std::optional<util::Date>& date) {
  return date ? util::FormatDate(*date) : std::string();
}

std::string FormatOptionalAmount(const std::optional<double>& amount) {
  return amount ? util::FormatDecimal(*amount) : std::string();
}

// ------------------------------------------------------------
// Row reader
// ------------------------------------------------------------

class RowReader {
 public:
  RowReader(const Table& table, const std::map<std::string, std::size_t>& index, std::size_t row)
      : table_(table), index_(index), row_(row) {
  }

  // First non-blank value among the aliases, trimmed.
  std::string Text(Aliases aliases) const {
    for (auto alias : aliases) {
      auto it = index_.find(HeaderKey(alias));
      if (it == index_.end()) continue;
      auto value = util::Trim(table_.Cell(row_, it->second));
      if (!value.empty()) return value;
    }
    return {};
  }

  std::optional<util::Date> Date(Aliases aliases) const {
    return util::ParseDate(Text(aliases));
  }

  std::optional<double> Amount(Aliases aliases) const {
    return model::ParseAmount(Text(aliases));
  }

  int Percent(Aliases aliases) const {
    const auto text = Text(aliases);
    if (auto value = model::ParsePercent(text)) return *value;
    if (auto value = util::ParseDecimal(util::RemoveAll(text, {"%"}))) return static_cast<int>(std::lround(*value));
    return 0;
  }

 private:
  const Table&                              table_;
  const std::map<std::string, std::size_t>& index_;
  std::size_t                               row_;
};

Deal ReadDeal(const Table& table, const std::map<std::string, std::size_t>& index, std::size_t row) {
  RowReader r(table, index, row);

  Deal deal;
  deal.deal_id               = r.Text(kDealId);
  deal.order_no              = r.Text(kOrderNo);
  deal.user_id               = r.Text(kUserId);
  deal.account_name          = r.Text(kAccountName);
  deal.contact_name          = r.Text(kContactName);
  deal.email                 = r.Text(kEmail);
  deal.phone                 = r.Text(kPhone);
  deal.postcode              = r.Text(kPostcode);
  deal.postcode_area         = r.Text(kPostcodeArea);
  deal.installation_location = r.Text(kInstallationLocation);
  deal.region                = r.Text(kRegion);
  deal.map_link              = r.Text(kMapLink);
  deal.lead_source           = r.Text(kLeadSource);
  deal.product_line          = r.Text(kProductLine);
  deal.deal_name             = r.Text(kDealName);
  deal.stage                 = model::ParseStage(r.Text(kStage));
  deal.probability           = r.Percent(kProbability);
  deal.amount_gbp            = r.Amount(kAmount);
  deal.owner                 = r.Text(kOwner);
  deal.created_date          = r.Date(kCreatedDate);
  deal.last_contacted_date   = r.Date(kLastContactedDate);
  deal.next_step             = r.Text(kNextStep);
  deal.next_step_due_date    = r.Date(kNextStepDueDate);
  deal.close_date            = r.Date(kCloseDate);
  deal.service_plan          = r.Text(kServicePlan);
  deal.last_service_date     = r.Date(kLastServiceDate);
  deal.next_service_due_date = r.Date(kNextServiceDueDate);
  deal.comments              = r.Text(kComments);
  deal.tags                  = model::ParseTagList(r.Text(kTags));
  deal.promoter_id           = r.Text(kPromoterId);
  deal.promo_code            = r.Text(kPromoCode);
  deal.promoter_commission   = r.Amount(kPromoterCommission);
  deal.commission_paid       = model::ParseFlag(r.Text(kCommissionPaid)).value_or(false);
  deal.commission_paid_date  = r.Date(kCommissionPaidDate);

  if (deal.account_name.empty()) deal.account_name = "Unknown";
  if (deal.deal_name.empty()) deal.deal_name = "Unnamed Deal";

  for (std::size_t column = 0; column < table.columns.size(); ++column) {
    if (RecognizedHeaderKeys().contains(HeaderKey(table.columns[column]))) continue;
    const auto& value = table.Cell(row, column);
    if (!value.empty()) deal.extra_columns.emplace_back(table.columns[column], value);
  }

  return deal;
}

Row WriteDeal(const Deal& deal, const std::vector<std::string>& columns) {
  Row row = {
      deal.deal_id,
      deal.order_no,
      deal.user_id,
      deal.account_name,
      deal.contact_name,
      deal.email,
      deal.phone,
      deal.postcode,
      deal.postcode_area,
      deal.installation_location,
      deal.region,
      deal.map_link,
      deal.lead_source,
      deal.product_line,
      deal.deal_name,
      std::string(model::StageName(deal.stage)),
      std::to_string(deal.probability),
      FormatOptionalAmount(deal.amount_gbp),
      FormatOptionalAmount(deal.WeightedAmountGbp()),
      deal.owner,
      FormatOptionalDate(deal.created_date),
      FormatOptionalDate(deal.last_contacted_date),
      deal.next_step,
      FormatOptionalDate(deal.next_step_due_date),
      FormatOptionalDate(deal.close_date),
      deal.service_plan,
      FormatOptionalDate(deal.last_service_date),
      FormatOptionalDate(deal.next_service_due_date),
      deal.comments,
      model::FormatTagList(deal.tags),
      deal.promoter_id,
      deal.promo_code,
      FormatOptionalAmount(deal.promoter_commission),
      deal.commission_paid ? "Yes" : "No",
      FormatOptionalDate(deal.commission_paid_date),
  };

  row.resize(columns.size());
  for (const auto& [name, value] : deal.extra_columns) {
    for (std::size_t column = DealColumns().size(); column < columns.size(); ++column) {
      if (HeaderKey(columns[column]) == HeaderKey(name)) {
        row[column] = value;
        break;
      }
    }
  }
  return row;
}

Table EncodeDeals(const std::vector<Deal>& deals) {
  Table table{std::string(kDealsTable), DealColumns(), {}};

  std::set<std::string> seen;
  for (const auto& column : table.columns) seen.insert(HeaderKey(column));
  for (const auto& deal : deals) {
    for (const auto& [name, value] : deal.extra_columns) {
      if (seen.insert(HeaderKey(name)).second) table.columns.push_back(name);
    }
  }

  table.rows.reserve(deals.size());
  for (const auto& deal : deals) {
    table.rows.push_back(WriteDeal(deal, table.columns));
  }
  return table;
}

Table EncodeLookups(const model::LookupTables& lookups) {
  Table table{std::string(kLookupsTable), {"PostcodeArea", "Region", "Stage", "DefaultProbability"}, {}};

  const auto& regions = lookups.Regions();
  const auto& stages  = lookups.StageProbabilities();
  table.rows.resize(std::max(regions.size(), stages.size()), Row(table.columns.size()));

  std::size_t row = 0;
  for (const auto& [area, region] : regions) {
    table.rows[row][0] = area;
    table.rows[row][1] = region;
    ++row;
  }
  row = 0;
  for (const auto& [stage, probability] : stages) {
    table.rows[row][2] = std::string(model::StageName(stage));
    table.rows[row][3] = std::to_string(probability);
    ++row;
  }
  return table;
}

// ------------------------------------------------------------
// Per-version encoders
// ------------------------------------------------------------

struct LayoutSpec {
  std::string_view version;
  bool             write_metadata;
  bool             write_generated_by;
};

class VersionedLayoutEncoder final : public LayoutEncoder {
 public:
  explicit VersionedLayoutEncoder(LayoutSpec spec) : spec_(spec) {
  }

  std::string_view Version() const override {
    return spec_.version;
  }

  Workbook Encode(const std::vector<Deal>& deals, const model::LookupTables& lookups, const MetadataStamp& stamp) const override {
    Workbook workbook;
    workbook.tables.push_back(EncodeDeals(deals));
    workbook.tables.push_back(EncodeLookups(lookups));

    if (spec_.write_metadata) {
      Table& metadata = workbook.AddTable(std::string(kMetadataTable), {std::string(kPropertyColumn), std::string(kValueColumn)});
      SetMetadataValue(metadata, kVersionProperty, std::string(spec_.version));
      SetMetadataValue(metadata, "LastModified", util::FormatIso8601(stamp.last_modified));
      SetMetadataValue(metadata, "DealCount", std::to_string(deals.size()));
      if (spec_.write_generated_by) {
        SetMetadataValue(metadata, "GeneratedBy", stamp.generated_by);
      }
    }
    return workbook;
  }

 private:
  LayoutSpec spec_;
};

const std::vector<VersionedLayoutEncoder>& Encoders() {
  static const std::vector<VersionedLayoutEncoder> kEncoders = {
      VersionedLayoutEncoder({"1.0", false, false}),
      VersionedLayoutEncoder({"1.1", true, false}),
      VersionedLayoutEncoder({"1.2", true, true}),
  };
  return kEncoders;
}

} // namespace

const LayoutEncoder& EncoderFor(std::string_view version) {
  for (const auto& encoder : Encoders()) {
    if (encoder.Version() == version) return encoder;
  }
  throw util::UnsupportedVersionError(std::string(version), "No layout encoder for schema version " + std::string(version));
}

std::vector<std::string> KnownLayoutVersions() {
  std::vector<std::string> versions;
  for (const auto& encoder : Encoders()) versions.emplace_back(encoder.Version());
  return versions;
}

const std::vector<std::string>& DealColumns() {
  static const std::vector<std::string> kColumns = [] {
    std::vector<std::string> columns;
    for (const auto& aliases : AllDealAliases()) columns.emplace_back(*aliases.begin());
    return columns;
  }();
  return kColumns;
}

std::vector<Deal> DecodeDeals(const Workbook& workbook) {
  std::vector<Deal> deals;
  const Table*      table = workbook.FindTable(kDealsTable);
  if (!table) return deals;

  std::map<std::string, std::size_t> index;
  for (std::size_t column = 0; column < table->columns.size(); ++column) {
    index.emplace(HeaderKey(table->columns[column]), column);
  }

  for (std::size_t row = 0; row < table->rows.size(); ++row) {
    if (table->IsBlankRow(row)) continue;
    deals.push_back(ReadDeal(*table, index, row));
  }
  return deals;
}

std::optional<model::LookupTables> DecodeLookups(const Workbook& workbook) {
  const Table* table = workbook.FindTable(kLookupsTable);
  if (!table) return std::nullopt;

  auto lookups = model::LookupTables::CreateDefault();

  const auto area_col        = table->ColumnIndex("PostcodeArea");
  const auto region_col      = table->ColumnIndex("Region");
  const auto stage_col       = table->ColumnIndex("Stage");
  const auto probability_col = table->ColumnIndex("DefaultProbability");

  for (std::size_t row = 0; row < table->rows.size(); ++row) {
    if (area_col && region_col) {
      const auto area   = util::Trim(table->Cell(row, *area_col));
      const auto region = util::Trim(table->Cell(row, *region_col));
      if (!area.empty() && !region.empty()) lookups.SetRegion(area, region);
    }
    if (stage_col && probability_col) {
      const auto stage       = util::Trim(table->Cell(row, *stage_col));
      const auto probability = model::ParsePercent(table->Cell(row, *probability_col));
      if (!stage.empty() && probability) lookups.SetStageProbability(model::ParseStage(stage), *probability);
    }
  }
  return lookups;
}

DecodedWorkbook DecodeWorkbook(Workbook workbook, const MigrationChain& chain, const std::string& target_version) {
  DecodedWorkbook decoded;
  decoded.source_version = DetectVersion(workbook);
  if (decoded.source_version != target_version) {
    decoded.migrations_applied = chain.Migrate(workbook, decoded.source_version, target_version);
  }
  decoded.deals   = DecodeDeals(workbook);
  decoded.lookups = DecodeLookups(workbook);
  return decoded;
}

} // namespace pipeline::db::workbook
