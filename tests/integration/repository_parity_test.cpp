#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/context/system_context.hpp"
#include "internal/db/api/deal_filter.hpp"
#include "internal/db/api/deal_repository.hpp"
#include "internal/db/memory/memory_deal_repository.hpp"
#include "internal/db/workbook/workbook_repository.hpp"
#include "internal/model/lookup_tables.hpp"

namespace {

using namespace std::chrono;
using pipeline::db::DealFilter;
using pipeline::db::DealRepository;
using pipeline::db::memory::MemoryDealRepository;
using pipeline::db::workbook::WorkbookDealRepository;
using pipeline::db::workbook::WorkbookStoreOptions;
using pipeline::model::Deal;
using pipeline::model::DealStage;

constexpr pipeline::util::Date kReference{year{2025}, March, day{15}};

struct BackendFactory {
  std::string                                          name;
  std::function<std::shared_ptr<DealRepository>()>     make_repository;
  std::function<bool()>                                supports_restart;
  std::function<void(std::shared_ptr<DealRepository>&)> restart;
  std::function<void()>                                cleanup;
};

Deal MakeDeal(const std::string& id, const std::string& owner, double amount) {
  Deal deal;
  deal.deal_id      = id;
  deal.account_name = "Account " + id;
  deal.deal_name    = "Deal " + id;
  deal.stage        = DealStage::Proposal;
  deal.probability  = 60;
  deal.amount_gbp   = amount;
  deal.owner        = owner;
  deal.region       = "London";
  deal.created_date = kReference;
  return deal;
}

void VerifyUpsertReplacesCaseInsensitively(DealRepository& repo, const std::string& prefix) {
  repo.Upsert(MakeDeal(prefix + "-A", "Ann", 1000));

  auto replacement  = MakeDeal(prefix + "-a", "Bob", 2000);
  repo.Upsert(replacement);

  auto stored = repo.GetById(prefix + "-A");
  assert(stored.has_value());
  assert(stored->owner == "Bob");
  assert(stored->amount_gbp == 2000);

  std::size_t matches = 0;
  for (const auto& deal : repo.GetAll()) {
    if (pipeline::model::SameDealId(deal.deal_id, prefix + "-A")) ++matches;
  }
  assert(matches == 1);
}

void VerifyReadsReturnCopies(DealRepository& repo, const std::string& prefix) {
  repo.Upsert(MakeDeal(prefix + "-copy", "Ann", 500));

  auto copy  = repo.GetById(prefix + "-copy");
  copy->owner = "Mallory";
  auto all   = repo.GetAll();
  for (auto& deal : all) deal.owner = "Mallory";

  assert(repo.GetById(prefix + "-copy")->owner == "Ann");
}

void VerifyDeleteAndMissingIds(DealRepository& repo, const std::string& prefix) {
  repo.Upsert(MakeDeal(prefix + "-gone", "Ann", 100));
  const auto before = repo.GetAll().size();

  repo.Delete(prefix + "-GONE");
  assert(!repo.GetById(prefix + "-gone").has_value());
  assert(repo.GetAll().size() == before - 1);

  repo.Delete(prefix + "-never-existed");
  assert(repo.GetAll().size() == before - 1);

  bool threw = false;
  try {
    repo.Upsert(Deal{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void VerifyQuery(DealRepository& repo, const std::string& prefix) {
  repo.UpsertMany({MakeDeal(prefix + "-q1", "Quinn", 100), MakeDeal(prefix + "-q2", "Quinn", 5000), MakeDeal(prefix + "-q3", "Other", 5000)});

  DealFilter filter;
  filter.owner      = "QUINN";
  filter.min_amount = 1000;

  auto matches = repo.Query(filter, kReference);
  assert(matches.size() == 1);
  assert(matches[0].deal_id == prefix + "-q2");

  const auto all = repo.Query(DealFilter{}, kReference);
  assert(all.size() == repo.GetAll().size());
}

void VerifyConcurrentUpserts(DealRepository& repo, const std::string& prefix) {
  const auto before = repo.GetAll().size();

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&repo, &prefix, t] {
      for (int i = 0; i < 25; ++i) {
        repo.Upsert(MakeDeal(prefix + "-t" + std::to_string(t) + "-" + std::to_string(i), "Ann", i));
        (void)repo.GetAll();
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(repo.GetAll().size() == before + 100);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) return;

  auto repo = backend.make_repository();
  repo->Upsert(MakeDeal(prefix + "-kept", "Ann", 750));
  repo->SaveChanges();

  repo->Upsert(MakeDeal(prefix + "-unsaved", "Ann", 10));
  backend.restart(repo);

  assert(repo->GetById(prefix + "-kept").has_value());
  assert(repo->GetById(prefix + "-kept")->amount_gbp == 750);
  assert(!repo->GetById(prefix + "-unsaved").has_value());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryDealRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<DealRepository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeWorkbookFactory() {
  const auto dir = std::filesystem::temp_directory_path() / "pipeline_manager_integration_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  auto context = pipeline::context::SystemContext::ForTesting(kReference);
  auto lookups = std::make_shared<const pipeline::model::LookupTables>(pipeline::model::LookupTables::CreateDefault());

  auto make_repo = [dir, context, lookups]() -> std::shared_ptr<DealRepository> {
    WorkbookStoreOptions options;
    options.path  = dir / "parity.db";
    options.fsync = false;
    return std::make_shared<WorkbookDealRepository>(options, context, lookups);
  };

  return BackendFactory{
      .name             = "workbook",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<DealRepository>& repo) { repo = make_repo(); },
      .cleanup          = [dir]() { std::filesystem::remove_all(dir); },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyUpsertReplacesCaseInsensitively(*repo, backend.name + "-upsert");
  VerifyReadsReturnCopies(*repo, backend.name);
  VerifyDeleteAndMissingIds(*repo, backend.name);
  VerifyQuery(*repo, backend.name);
  VerifyConcurrentUpserts(*repo, backend.name);

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeWorkbookFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "pipeline_manager_integration_repository_parity: pass\n";
  return 0;
}
