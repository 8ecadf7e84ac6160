#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace pipeline::model {

enum class DealStage {
  Lead        = 0,
  Qualified   = 1,
  Discovery   = 2,
  Proposal    = 3,
  Negotiation = 4,
  ClosedWon   = 5,
  ClosedLost  = 6,
  OnHold      = 7,
  Other       = 99,
};

// Every stage in enumeration order.
const std::vector<DealStage>& AllStages();

// "Closed Won", "On Hold", ...
std::string_view StageName(DealStage stage);

int DefaultProbability(DealStage stage);

bool IsClosed(DealStage stage);

/*
  Stage text matching ignores case, spaces, '-' and '_', and accepts the
  short aliases "won", "lost" and "hold".

  TryParseStage is strict: blank or unknown text yields nullopt.
  ParseStage is the lenient form used when reading stored rows: blank
  maps to Lead and unknown text to Other.
*/
std::optional<DealStage> TryParseStage(std::string_view text);
DealStage                ParseStage(std::string_view text);

/*
  Deal

  One pipeline record. Text fields use the empty string for "unset".
  The weighted amount is derived and never stored.
*/
struct Deal {
  std::string deal_id;
  std::string order_no;
  std::string user_id;
  std::string account_name;
  std::string contact_name;
  std::string email;
  std::string phone;

  std::string postcode;
  std::string postcode_area;
  std::string installation_location;
  std::string region;
  std::string map_link;

  std::string lead_source;
  std::string product_line;

  std::string           deal_name;
  DealStage             stage       = DealStage::Lead;
  int                   probability = 0;
  std::optional<double> amount_gbp;

  std::string owner;

  std::optional<util::Date> created_date;
  std::optional<util::Date> last_contacted_date;
  std::string               next_step;
  std::optional<util::Date> next_step_due_date;
  std::optional<util::Date> close_date;

  std::string               service_plan;
  std::optional<util::Date> last_service_date;
  std::optional<util::Date> next_service_due_date;

  std::string              comments;
  std::vector<std::string> tags;

  std::string               promoter_id;
  std::string               promo_code;
  std::optional<double>     promoter_commission;
  bool                      commission_paid = false;
  std::optional<util::Date> commission_paid_date;

  // Columns this layout does not know, carried through unchanged.
  std::vector<std::pair<std::string, std::string>> extra_columns;

  std::optional<double> WeightedAmountGbp() const;

  bool operator==(const Deal&) const = default;
};

bool SameDealId(std::string_view a, std::string_view b);

// ---------------------------------------------------------------------
// Field value parsing shared by the row codec and the patch engine
// ---------------------------------------------------------------------

// Accepts "£1,250.50", "1 250", "$99". nullopt when unparseable.
std::optional<double> ParseAmount(std::string_view text);

// Accepts "60" and "60%". nullopt when unparseable.
std::optional<int> ParsePercent(std::string_view text);

// true/false, yes/no, 1/0 (case-insensitive). nullopt otherwise.
std::optional<bool> ParseFlag(std::string_view text);

// Splits on ',', ';' and '|', trimming each tag.
std::vector<std::string> ParseTagList(std::string_view text);

std::string FormatTagList(const std::vector<std::string>& tags);

} // namespace pipeline::model
