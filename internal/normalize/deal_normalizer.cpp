#include "deal_normalizer.hpp"

#include <stdexcept>

#include "internal/util/strings.hpp"

namespace pipeline::normalize {

namespace {

constexpr const char* kMapSearchPrefix = "https://www.google.com/maps/search/?api=1&query=";

struct TextField {
  const char*                name;
  std::string model::Deal::* member;
};

// Free-text fields; stored cells are read back trimmed.
constexpr TextField kTextFields[] = {
    {"DealId", &model::Deal::deal_id},
    {"OrderNo", &model::Deal::order_no},
    {"UserId", &model::Deal::user_id},
    {"AccountName", &model::Deal::account_name},
    {"ContactName", &model::Deal::contact_name},
    {"Email", &model::Deal::email},
    {"Phone", &model::Deal::phone},
    {"Postcode", &model::Deal::postcode},
    {"InstallationLocation", &model::Deal::installation_location},
    {"Region", &model::Deal::region},
    {"MapLink", &model::Deal::map_link},
    {"LeadSource", &model::Deal::lead_source},
    {"ProductLine", &model::Deal::product_line},
    {"DealName", &model::Deal::deal_name},
    {"Owner", &model::Deal::owner},
    {"NextStep", &model::Deal::next_step},
    {"ServicePlan", &model::Deal::service_plan},
    {"Comments", &model::Deal::comments},
    {"PromoterId", &model::Deal::promoter_id},
    {"PromoCode", &model::Deal::promo_code},
};

// A tag may not contain a list separator, or it would split when read back.
std::vector<std::string> CleanTags(const std::vector<std::string>& tags) {
  std::vector<std::string> cleaned;
  for (const auto& tag : tags) {
    for (auto& piece : model::ParseTagList(tag)) {
      bool duplicate = false;
      for (const auto& kept : cleaned) {
        if (util::EqualsIgnoreCase(kept, piece)) {
          duplicate = true;
          break;
        }
      }
      if (!duplicate) cleaned.push_back(std::move(piece));
    }
  }
  return cleaned;
}

} // namespace

DealNormalizer::DealNormalizer(std::shared_ptr<const model::LookupTables> lookups, std::shared_ptr<const context::SystemContext> context)
    : lookups_(std::move(lookups)), context_(std::move(context)) {
  if (!lookups_ || !context_) {
    throw std::invalid_argument("DealNormalizer requires lookup tables and a system context");
  }
}

model::Deal DealNormalizer::Normalize(const model::Deal& deal) const {
  return NormalizeWithTracking(deal).deal;
}

std::string DealNormalizer::BuildMapLink(const model::Deal& deal) {
  const auto address = util::IsBlank(deal.installation_location) ? deal.postcode : deal.installation_location + ", " + deal.postcode;
  return kMapSearchPrefix + util::EscapeUriComponent(address);
}

NormalizationResult DealNormalizer::NormalizeWithTracking(const model::Deal& deal) const {
  NormalizationResult result{deal, {}};
  auto&               d = result.deal;

  for (const auto& field : kTextFields) {
    auto trimmed = util::Trim(d.*field.member);
    if (trimmed != d.*field.member) {
      result.changes.push_back({field.name, d.*field.member, trimmed, "Trimmed surrounding whitespace"});
      d.*field.member = std::move(trimmed);
    }
  }

  if (d.deal_id.empty()) {
    d.deal_id = context_->NewDealId();
    result.changes.push_back({"DealId", "", d.deal_id, "Auto-generated missing DealId"});
  }

  if (d.probability <= 0) {
    const int probability = lookups_->ProbabilityForStage(d.stage);
    if (probability != d.probability) {
      result.changes.push_back({"Probability", std::to_string(d.probability), std::to_string(probability),
                                "Set default probability for stage " + std::string(model::StageName(d.stage))});
      d.probability = probability;
    }
  }

  if (!util::IsBlank(d.postcode)) {
    const auto area = model::LookupTables::ExtractPostcodeArea(d.postcode);
    if (area != d.postcode_area) {
      result.changes.push_back({"PostcodeArea", d.postcode_area, area, "Extracted from postcode " + d.postcode});
      d.postcode_area = area;
    }

    if (d.region.empty()) {
      if (auto region = lookups_->RegionForArea(area)) {
        result.changes.push_back({"Region", "", *region, "Derived from postcode area " + area});
        d.region = std::move(*region);
      }
    }

    if (util::IsBlank(d.map_link)) {
      auto link = BuildMapLink(d);
      result.changes.push_back({"MapLink", d.map_link, link, "Generated Google Maps link from address"});
      d.map_link = std::move(link);
    }
  }

  if (!d.created_date) {
    d.created_date = context_->Today();
    result.changes.push_back({"CreatedDate", "", util::FormatDate(*d.created_date), "Set default creation date"});
  }

  auto cleaned = CleanTags(d.tags);
  if (cleaned != d.tags) {
    result.changes.push_back({"Tags", model::FormatTagList(d.tags), model::FormatTagList(cleaned), "Cleaned and deduplicated tags"});
    d.tags = std::move(cleaned);
  }

  return result;
}

} // namespace pipeline::normalize
