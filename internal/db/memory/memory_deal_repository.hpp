#pragma once

#include <mutex>
#include <vector>

#include "internal/db/api/deal_repository.hpp"

namespace pipeline::db::memory {

/*
  Pure in-process cache. SaveChanges has nothing to persist.
  Used as the reference implementation and as the test double.
*/
class MemoryDealRepository final : public db::DealRepository {
 public:
  MemoryDealRepository() = default;
  explicit MemoryDealRepository(std::vector<model::Deal> seed);

  std::vector<model::Deal>   GetAll() override;
  std::optional<model::Deal> GetById(const std::string& deal_id) override;
  std::vector<model::Deal>   Query(const DealFilter& filter, util::Date reference_date) override;

  void Upsert(const model::Deal& deal) override;
  void UpsertMany(const std::vector<model::Deal>& deals) override;
  void Delete(const std::string& deal_id) override;
  void SaveChanges() override;

  void Clear();

 private:
  std::mutex               mutex_;
  std::vector<model::Deal> deals_;
};

} // namespace pipeline::db::memory
