#include "deal_patch.hpp"

#include <array>
#include <variant>

#include "internal/util/strings.hpp"

namespace pipeline::patch {

namespace {

using model::Deal;

using TextMember   = std::string Deal::*;
using DateMember   = std::optional<util::Date> Deal::*;
using AmountMember = std::optional<double> Deal::*;

enum class FieldKind {
  Text,
  RequiredText,
  Stage,
  Probability,
  Amount,
  Commission,
  Date,
  Flag,
  Tags,
};

struct FieldSpec {
  std::string_view                                        name;
  FieldKind                                               kind;
  std::variant<std::monostate, TextMember, DateMember, AmountMember> member;
};

// clang-format off
const std::array<FieldSpec, 31> kPatchableFields = {{
    {"OrderNo",              FieldKind::Text,         &Deal::order_no},
    {"UserId",               FieldKind::Text,         &Deal::user_id},
    {"AccountName",          FieldKind::RequiredText, &Deal::account_name},
    {"ContactName",          FieldKind::Text,         &Deal::contact_name},
    {"Email",                FieldKind::Text,         &Deal::email},
    {"Phone",                FieldKind::Text,         &Deal::phone},
    {"Postcode",             FieldKind::Text,         &Deal::postcode},
    {"InstallationLocation", FieldKind::Text,         &Deal::installation_location},
    {"LeadSource",           FieldKind::Text,         &Deal::lead_source},
    {"ProductLine",          FieldKind::Text,         &Deal::product_line},
    {"DealName",             FieldKind::RequiredText, &Deal::deal_name},
    {"Stage",                FieldKind::Stage,        std::monostate{}},
    {"Probability",          FieldKind::Probability,  std::monostate{}},
    {"AmountGBP",            FieldKind::Amount,       &Deal::amount_gbp},
    {"Owner",                FieldKind::Text,         &Deal::owner},
    {"CreatedDate",          FieldKind::Date,         &Deal::created_date},
    {"LastContactedDate",    FieldKind::Date,         &Deal::last_contacted_date},
    {"NextStep",             FieldKind::Text,         &Deal::next_step},
    {"NextStepDueDate",      FieldKind::Date,         &Deal::next_step_due_date},
    {"CloseDate",            FieldKind::Date,         &Deal::close_date},
    {"ServicePlan",          FieldKind::Text,         &Deal::service_plan},
    {"LastServiceDate",      FieldKind::Date,         &Deal::last_service_date},
    {"NextServiceDueDate",   FieldKind::Date,         &Deal::next_service_due_date},
    {"Comments",             FieldKind::Text,         &Deal::comments},
    {"Tags",                 FieldKind::Tags,         std::monostate{}},
    {"PromoterId",           FieldKind::Text,         &Deal::promoter_id},
    {"PromoCode",            FieldKind::Text,         &Deal::promo_code},
    {"PromoterCommission",   FieldKind::Commission,   &Deal::promoter_commission},
    {"CommissionPaid",       FieldKind::Flag,         std::monostate{}},
    {"CommissionPaidDate",   FieldKind::Date,         &Deal::commission_paid_date},
    {"Amount",               FieldKind::Amount,       &Deal::amount_gbp},
}};
// clang-format on

constexpr std::array<std::string_view, 4> kDerivedFields = {"PostcodeArea", "Region", "MapLink", "WeightedAmountGBP"};

const FieldSpec* FindField(std::string_view name) {
  for (const auto& spec : kPatchableFields) {
    if (util::EqualsIgnoreCase(spec.name, name)) return &spec;
  }
  return nullptr;
}

std::string FormatDate(const std::optional<util::Date>& date) {
  return date ? util::FormatDate(*date) : std::string();
}

std::string FormatAmount(const std::optional<double>& amount) {
  return amount ? util::FormatDecimal(*amount) : std::string();
}

std::string FormatFlag(bool value) {
  return value ? "true" : "false";
}

// Alias entries report the canonical field name.
std::string_view CanonicalName(const FieldSpec& spec) {
  return spec.name == "Amount" ? std::string_view("AmountGBP") : spec.name;
}

/*
  Parses and applies one field. Returns the rejection reason, or an empty
  string when the value was applied.
*/
std::string ApplyField(Deal& deal, const FieldSpec& spec, const FieldValue& value, AppliedField& applied) {
  const std::string name(CanonicalName(spec));
  applied.field = name;

  switch (spec.kind) {
    case FieldKind::Text:
    case FieldKind::RequiredText: {
      if (!value && spec.kind == FieldKind::RequiredText) return name + " is required and cannot be cleared";
      auto member       = std::get<TextMember>(spec.member);
      applied.old_value = deal.*member;
      deal.*member      = value ? util::Trim(*value) : std::string();
      applied.new_value = deal.*member;
      return {};
    }

    case FieldKind::Stage: {
      if (!value) return name + " is required and cannot be cleared";
      auto stage = model::TryParseStage(*value);
      if (!stage) return "Unknown stage: " + *value;
      applied.old_value = std::string(model::StageName(deal.stage));
      deal.stage        = *stage;
      applied.new_value = std::string(model::StageName(deal.stage));
      return {};
    }

    case FieldKind::Probability: {
      if (!value) return name + " is required and cannot be cleared";
      auto probability = util::ParseInt(*value);
      if (!probability) return "Invalid probability value";
      if (*probability < 0 || *probability > 100) return "Probability must be between 0 and 100";
      applied.old_value = std::to_string(deal.probability);
      deal.probability  = *probability;
      applied.new_value = std::to_string(deal.probability);
      return {};
    }

    case FieldKind::Amount:
    case FieldKind::Commission: {
      auto                  member = std::get<AmountMember>(spec.member);
      std::optional<double> parsed;
      if (value) {
        parsed = model::ParseAmount(*value);
        if (!parsed) return spec.kind == FieldKind::Amount ? "Invalid amount value" : "Invalid commission value";
        if (*parsed < 0) return spec.kind == FieldKind::Amount ? "Amount cannot be negative" : "Commission cannot be negative";
      }
      applied.old_value = FormatAmount(deal.*member);
      deal.*member      = parsed;
      applied.new_value = FormatAmount(deal.*member);
      return {};
    }

    case FieldKind::Date: {
      auto                      member = std::get<DateMember>(spec.member);
      std::optional<util::Date> parsed;
      if (value) {
        parsed = util::ParseDate(*value);
        if (!parsed) return "Invalid date format";
      }
      applied.old_value = FormatDate(deal.*member);
      deal.*member      = parsed;
      applied.new_value = FormatDate(deal.*member);
      return {};
    }

    case FieldKind::Flag: {
      if (!value) return name + " is required and cannot be cleared";
      auto flag = model::ParseFlag(*value);
      if (!flag) return "Invalid boolean value for CommissionPaid";
      applied.old_value    = FormatFlag(deal.commission_paid);
      deal.commission_paid = *flag;
      applied.new_value    = FormatFlag(deal.commission_paid);
      return {};
    }

    case FieldKind::Tags: {
      applied.old_value = model::FormatTagList(deal.tags);
      deal.tags         = value ? model::ParseTagList(*value) : std::vector<std::string>{};
      applied.new_value = model::FormatTagList(deal.tags);
      return {};
    }
  }
  return "Unknown field: " + name;
}

} // namespace

PatchOutcome DealPatcher::Apply(model::Deal& deal, const PatchRequest& request) {
  PatchOutcome outcome;

  for (const auto& [field, value] : request) {
    const std::string attempted = value.value_or(std::string());

    if (util::EqualsIgnoreCase(field, "DealId")) {
      outcome.rejected.push_back({field, attempted, "DealId is the key and cannot be patched"});
      continue;
    }

    bool derived = false;
    for (auto name : kDerivedFields) {
      derived = derived || util::EqualsIgnoreCase(field, name);
    }
    if (derived) {
      outcome.rejected.push_back({field, attempted, field + " is a derived field and cannot be patched directly"});
      continue;
    }

    const FieldSpec* spec = FindField(field);
    if (!spec) {
      outcome.rejected.push_back({field, attempted, "Unknown field: " + field});
      continue;
    }

    AppliedField applied;
    if (auto reason = ApplyField(deal, *spec, value, applied); !reason.empty()) {
      outcome.rejected.push_back({field, attempted, std::move(reason)});
      continue;
    }

    if (applied.field == "Postcode" && applied.old_value != applied.new_value) {
      deal.postcode_area.clear();
      deal.region.clear();
      deal.map_link.clear();
    } else if (applied.field == "InstallationLocation" && applied.old_value != applied.new_value) {
      deal.map_link.clear();
    }

    outcome.applied.push_back(std::move(applied));
  }

  return outcome;
}

bool DealPatcher::IsPatchable(std::string_view field) {
  return FindField(field) != nullptr;
}

std::vector<std::string_view> DealPatcher::PatchableFields() {
  std::vector<std::string_view> names;
  for (const auto& spec : kPatchableFields) {
    if (spec.name != "Amount") names.push_back(spec.name);
  }
  return names;
}

} // namespace pipeline::patch
