#include "deal.hpp"

#include <array>

#include "internal/util/strings.hpp"

namespace pipeline::model {

namespace {

std::string StageKey(std::string_view text) {
  return util::ToLower(util::RemoveAll(util::Trim(text), {" ", "-", "_"}));
}

} // namespace

const std::vector<DealStage>& AllStages() {
  static const std::vector<DealStage> kStages = {DealStage::Lead,      DealStage::Qualified,  DealStage::Discovery,
                                                 DealStage::Proposal,  DealStage::Negotiation, DealStage::ClosedWon,
                                                 DealStage::ClosedLost, DealStage::OnHold,     DealStage::Other};
  return kStages;
}

std::string_view StageName(DealStage stage) {
  switch (stage) {
    case DealStage::Lead:
      return "Lead";
    case DealStage::Qualified:
      return "Qualified";
    case DealStage::Discovery:
      return "Discovery";
    case DealStage::Proposal:
      return "Proposal";
    case DealStage::Negotiation:
      return "Negotiation";
    case DealStage::ClosedWon:
      return "Closed Won";
    case DealStage::ClosedLost:
      return "Closed Lost";
    case DealStage::OnHold:
      return "On Hold";
    case DealStage::Other:
      return "Other";
  }
  return "Other";
}

int DefaultProbability(DealStage stage) {
  switch (stage) {
    case DealStage::Lead:
      return 10;
    case DealStage::Qualified:
      return 20;
    case DealStage::Discovery:
      return 40;
    case DealStage::Proposal:
      return 60;
    case DealStage::Negotiation:
      return 80;
    case DealStage::ClosedWon:
      return 100;
    case DealStage::ClosedLost:
      return 0;
    case DealStage::OnHold:
    case DealStage::Other:
      return 10;
  }
  return 10;
}

bool IsClosed(DealStage stage) {
  return stage == DealStage::ClosedWon || stage == DealStage::ClosedLost;
}

std::optional<DealStage> TryParseStage(std::string_view text) {
  static const std::array<std::pair<std::string_view, DealStage>, 12> kKeys = {{
      {"lead", DealStage::Lead},
      {"qualified", DealStage::Qualified},
      {"discovery", DealStage::Discovery},
      {"proposal", DealStage::Proposal},
      {"negotiation", DealStage::Negotiation},
      {"closedwon", DealStage::ClosedWon},
      {"won", DealStage::ClosedWon},
      {"closedlost", DealStage::ClosedLost},
      {"lost", DealStage::ClosedLost},
      {"onhold", DealStage::OnHold},
      {"hold", DealStage::OnHold},
      {"other", DealStage::Other},
  }};

  const auto key = StageKey(text);
  for (const auto& [name, stage] : kKeys) {
    if (key == name) return stage;
  }
  return std::nullopt;
}

DealStage ParseStage(std::string_view text) {
  if (util::IsBlank(text)) return DealStage::Lead;
  return TryParseStage(text).value_or(DealStage::Other);
}

std::optional<double> Deal::WeightedAmountGbp() const {
  if (!amount_gbp) return std::nullopt;
  return *amount_gbp * probability / 100.0;
}

bool SameDealId(std::string_view a, std::string_view b) {
  return util::EqualsIgnoreCase(a, b);
}

std::optional<double> ParseAmount(std::string_view text) {
  return util::ParseDecimal(util::RemoveAll(text, {"\xC2\xA3", "$", "\xE2\x82\xAC", ",", " "}));
}

std::optional<int> ParsePercent(std::string_view text) {
  return util::ParseInt(util::RemoveAll(text, {"%"}));
}

std::optional<bool> ParseFlag(std::string_view text) {
  const auto value = util::ToLower(util::Trim(text));
  if (value == "true" || value == "yes" || value == "1") return true;
  if (value == "false" || value == "no" || value == "0") return false;
  return std::nullopt;
}

std::vector<std::string> ParseTagList(std::string_view text) {
  return util::Split(text, ",;|");
}

std::string FormatTagList(const std::vector<std::string>& tags) {
  return util::Join(tags, ", ");
}

} // namespace pipeline::model
