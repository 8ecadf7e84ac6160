#include "deal_filter.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace pipeline::db {

namespace {

bool EqualsIfSet(const std::string& wanted, const std::string& actual) {
  return util::IsBlank(wanted) || util::EqualsIgnoreCase(util::Trim(wanted), actual);
}

bool HasTag(const model::Deal& deal, const std::string& tag) {
  return std::any_of(deal.tags.begin(), deal.tags.end(), [&](const std::string& t) { return util::EqualsIgnoreCase(t, tag); });
}

} // namespace

bool DealFilter::Matches(const model::Deal& deal, util::Date reference_date) const {
  if (!util::IsBlank(search_text)) {
    const auto needle = util::Trim(search_text);
    const bool found  = util::ContainsIgnoreCase(deal.deal_name, needle) || util::ContainsIgnoreCase(deal.account_name, needle) ||
                       util::ContainsIgnoreCase(deal.contact_name, needle) || util::ContainsIgnoreCase(deal.deal_id, needle) ||
                       util::ContainsIgnoreCase(deal.owner, needle);
    if (!found) return false;
  }

  if (!stages.empty() && std::find(stages.begin(), stages.end(), deal.stage) == stages.end()) return false;

  if (!EqualsIfSet(owner, deal.owner)) return false;
  if (!EqualsIfSet(region, deal.region)) return false;
  if (!EqualsIfSet(product_line, deal.product_line)) return false;

  if (min_amount && (!deal.amount_gbp || *deal.amount_gbp < *min_amount)) return false;
  if (max_amount && (!deal.amount_gbp || *deal.amount_gbp > *max_amount)) return false;

  if (close_date_from && (!deal.close_date || *deal.close_date < *close_date_from)) return false;
  if (close_date_to && (!deal.close_date || *deal.close_date > *close_date_to)) return false;

  if (next_step_due_before && deal.next_step_due_date && *deal.next_step_due_date > *next_step_due_before) return false;

  if (has_overdue_next_step && (!deal.next_step_due_date || *deal.next_step_due_date >= reference_date)) return false;

  if (no_contact_days && deal.last_contacted_date) {
    if (util::DaysBetween(*deal.last_contacted_date, reference_date) < *no_contact_days) return false;
  }

  for (const auto& tag : tags) {
    if (!HasTag(deal, tag)) return false;
  }

  if (!EqualsIfSet(promoter_id, deal.promoter_id)) return false;
  if (!EqualsIfSet(promo_code, deal.promo_code)) return false;

  if (has_promoter) {
    const bool promoted = !util::IsBlank(deal.promoter_id) || !util::IsBlank(deal.promo_code);
    if (promoted != *has_promoter) return false;
  }

  return true;
}

bool DealFilter::IsEmpty() const {
  return util::IsBlank(search_text) && stages.empty() && util::IsBlank(owner) && util::IsBlank(region) && util::IsBlank(product_line) &&
         !min_amount && !max_amount && !close_date_from && !close_date_to && !next_step_due_before && !has_overdue_next_step &&
         !no_contact_days && tags.empty() && util::IsBlank(promoter_id) && util::IsBlank(promo_code) && !has_promoter;
}

} // namespace pipeline::db
