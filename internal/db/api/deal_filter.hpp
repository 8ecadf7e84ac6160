#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/deal.hpp"

namespace pipeline::db {

/*
  DealFilter

  Conjunction of optional predicates. An unset predicate always passes,
  so a default-constructed filter matches every deal. Date predicates
  are evaluated against the caller's reference date, never wall clock.
*/
struct DealFilter {
  // Case-insensitive substring over DealName, AccountName, ContactName, DealId, Owner.
  std::string search_text;

  std::vector<model::DealStage> stages;

  // Case-insensitive equality.
  std::string owner;
  std::string region;
  std::string product_line;

  // Inclusive. A deal without an amount fails either bound.
  std::optional<double> min_amount;
  std::optional<double> max_amount;

  // Inclusive. A deal without a close date fails either bound.
  std::optional<util::Date> close_date_from;
  std::optional<util::Date> close_date_to;

  // Deals without a next-step due date pass.
  std::optional<util::Date> next_step_due_before;

  // Due date strictly before the reference date.
  bool has_overdue_next_step = false;

  // Never-contacted deals match.
  std::optional<int> no_contact_days;

  // Every tag must be present (case-insensitive).
  std::vector<std::string> tags;

  std::string         promoter_id;
  std::string         promo_code;
  std::optional<bool> has_promoter;

  bool Matches(const model::Deal& deal, util::Date reference_date) const;

  bool IsEmpty() const;
};

} // namespace pipeline::db
