#include "internal/context/system_context.hpp"

#include <cassert>
#include <cctype>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/context/clock.hpp"
#include "internal/context/id_generator.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace std::chrono;
using pipeline::context::FixedClock;
using pipeline::context::RandomIdGenerator;
using pipeline::context::SeededIdGenerator;
using pipeline::context::SequentialIdGenerator;
using pipeline::context::SystemContext;
using pipeline::util::Date;

constexpr Date kMarch15{year{2025}, March, day{15}};

// D-yyyyMMdd-XXXXXXXX with upper-case hex
bool LooksLikeRandomId(const std::string& id) {
  if (id.size() != 19 || id.rfind("D-", 0) != 0 || id[10] != '-') return false;
  for (std::size_t i = 2; i < 10; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) return false;
  }
  for (std::size_t i = 11; i < id.size(); ++i) {
    const char c = id[i];
    if (!std::isdigit(static_cast<unsigned char>(c)) && !(c >= 'A' && c <= 'F')) return false;
  }
  return true;
}

void TestSequentialIdsAreDatedAndCounted() {
  auto ctx = SystemContext::ForTesting(kMarch15);
  assert(ctx->NewDealId() == "D-20250315-00000001");
  assert(ctx->NewDealId() == "D-20250315-00000002");
  assert(ctx->Today() == kMarch15);

  SequentialIdGenerator ids(kMarch15);
  (void)ids.NewDealId();
  ids.Reset();
  assert(ids.NewDealId() == "D-20250315-00000001");
}

void TestSeededIdsReproduce() {
  SeededIdGenerator a(12345, kMarch15);
  SeededIdGenerator b(12345, kMarch15);
  SeededIdGenerator other(54321, kMarch15);

  bool differs = false;
  for (int i = 0; i < 50; ++i) {
    const auto id = a.NewDealId();
    assert(LooksLikeRandomId(id));
    assert(id == b.NewDealId());
    if (id != other.NewDealId()) differs = true;
  }
  assert(differs);
}

void TestSeededIdDatesStayWithinAYear() {
  SeededIdGenerator ids(7, kMarch15);
  const auto        first = pipeline::util::FormatCompactDate(kMarch15);
  const auto        last  = pipeline::util::FormatCompactDate(Date{sys_days{kMarch15} + days{364}});

  for (int i = 0; i < 200; ++i) {
    const auto id   = ids.NewDealId();
    const auto date = id.substr(2, 8);
    assert(date >= first && date <= last);
  }
}

void TestRandomIdsUseClockDate() {
  auto              clock = std::make_shared<FixedClock>(kMarch15);
  RandomIdGenerator ids(clock);

  std::set<std::string> seen;
  for (int i = 0; i < 100; ++i) {
    const auto id = ids.NewDealId();
    assert(LooksLikeRandomId(id));
    assert(id.substr(0, 11) == "D-20250315-");
    seen.insert(id);
  }
  assert(seen.size() > 90);
}

void TestFixedClockCanBeAdvanced() {
  auto clock = std::make_shared<FixedClock>(kMarch15);
  clock->Advance(hours{24});
  assert(clock->Today() == (Date{year{2025}, March, day{16}}));

  clock->Set(pipeline::util::FromDate(Date{year{2024}, February, day{29}}));
  assert(clock->Today() == (Date{year{2024}, February, day{29}}));
}

void TestSyntheticContextUsesFixedClock() {
  auto ctx = SystemContext::ForSyntheticData(kMarch15, 99);
  assert(ctx->Today() == kMarch15);
  assert(LooksLikeRandomId(ctx->NewDealId()));
}

void TestNullDependenciesAreRejected() {
  bool threw = false;
  try {
    SystemContext ctx(nullptr, std::make_shared<SequentialIdGenerator>(kMarch15));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSequentialIdsAreDatedAndCounted();
  TestSeededIdsReproduce();
  TestSeededIdDatesStayWithinAYear();
  TestRandomIdsUseClockDate();
  TestFixedClockCanBeAdvanced();
  TestSyntheticContextUsesFixedClock();
  TestNullDependenciesAreRejected();

  std::cout << "pipeline_manager_unit_system_context: pass\n";
  return 0;
}
