#include "memory_deal_repository.hpp"

#include <utility>

#include "internal/db/api/deal_set.hpp"

namespace pipeline::db::memory {

MemoryDealRepository::MemoryDealRepository(std::vector<model::Deal> seed) {
  UpsertDeals(deals_, seed);
}

std::vector<model::Deal> MemoryDealRepository::GetAll() {
  std::lock_guard lock(mutex_);
  return deals_;
}

std::optional<model::Deal> MemoryDealRepository::GetById(const std::string& deal_id) {
  std::lock_guard lock(mutex_);
  auto            it = FindDeal(std::as_const(deals_), deal_id);
  if (it == deals_.cend()) return std::nullopt;
  return *it;
}

std::vector<model::Deal> MemoryDealRepository::Query(const DealFilter& filter, util::Date reference_date) {
  std::lock_guard          lock(mutex_);
  std::vector<model::Deal> matches;
  for (const auto& deal : deals_) {
    if (filter.Matches(deal, reference_date)) matches.push_back(deal);
  }
  return matches;
}

void MemoryDealRepository::Upsert(const model::Deal& deal) {
  std::lock_guard lock(mutex_);
  UpsertDeal(deals_, deal);
}

void MemoryDealRepository::UpsertMany(const std::vector<model::Deal>& deals) {
  std::lock_guard lock(mutex_);
  UpsertDeals(deals_, deals);
}

void MemoryDealRepository::Delete(const std::string& deal_id) {
  std::lock_guard lock(mutex_);
  EraseDeal(deals_, deal_id);
}

void MemoryDealRepository::SaveChanges() {
}

void MemoryDealRepository::Clear() {
  std::lock_guard lock(mutex_);
  deals_.clear();
}

} // namespace pipeline::db::memory
