#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/model/deal.hpp"

namespace pipeline::db {

/*
  Ordered in-memory deal list keyed by case-insensitive DealId.
  Shared by every backend so Upsert/Delete agree on matching rules.
*/

inline std::vector<model::Deal>::iterator FindDeal(std::vector<model::Deal>& deals, const std::string& deal_id) {
  return std::find_if(deals.begin(), deals.end(), [&](const model::Deal& d) { return model::SameDealId(d.deal_id, deal_id); });
}

inline std::vector<model::Deal>::const_iterator FindDeal(const std::vector<model::Deal>& deals, const std::string& deal_id) {
  return std::find_if(deals.begin(), deals.end(), [&](const model::Deal& d) { return model::SameDealId(d.deal_id, deal_id); });
}

// Replace in place or append.
inline void UpsertDeal(std::vector<model::Deal>& deals, const model::Deal& deal) {
  if (deal.deal_id.empty()) {
    throw std::invalid_argument("Deal must have a DealId before it is stored");
  }
  auto it = FindDeal(deals, deal.deal_id);
  if (it != deals.end()) {
    *it = deal;
  } else {
    deals.push_back(deal);
  }
}

// All-or-nothing: a batch with a keyless deal changes nothing.
inline void UpsertDeals(std::vector<model::Deal>& deals, const std::vector<model::Deal>& batch) {
  for (const auto& deal : batch) {
    if (deal.deal_id.empty()) {
      throw std::invalid_argument("Deal must have a DealId before it is stored");
    }
  }
  for (const auto& deal : batch) {
    UpsertDeal(deals, deal);
  }
}

// Returns true when a deal was removed.
inline bool EraseDeal(std::vector<model::Deal>& deals, const std::string& deal_id) {
  auto removed = std::erase_if(deals, [&](const model::Deal& d) { return model::SameDealId(d.deal_id, deal_id); });
  return removed > 0;
}

} // namespace pipeline::db
