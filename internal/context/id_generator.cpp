#include "id_generator.hpp"

#include <cstdio>

namespace pipeline::context {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

std::string FormatId(util::Date date, const std::string& suffix) {
  return "D-" + util::FormatCompactDate(date) + "-" + suffix;
}

} // namespace

RandomIdGenerator::RandomIdGenerator(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {
}

std::string RandomIdGenerator::NewDealId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::string suffix(8, '0');
  for (auto& c : suffix) {
    c = kHexDigits[rng() & 0x0F];
  }
  return FormatId(clock_->Today(), suffix);
}

SeededIdGenerator::SeededIdGenerator(uint64_t seed, util::Date base_date) : rng_(seed), base_date_(base_date) {
}

std::string SeededIdGenerator::NewDealId() {
  std::lock_guard lock(mutex_);

  std::string suffix(8, '0');
  for (auto& c : suffix) {
    c = kHexDigits[rng_() % 16];
  }

  const auto day_offset = std::chrono::days{static_cast<int>(rng_() % 365)};
  const auto date       = util::Date{std::chrono::sys_days{base_date_} + day_offset};
  return FormatId(date, suffix);
}

SequentialIdGenerator::SequentialIdGenerator(util::Date base_date) : base_date_(base_date) {
}

std::string SequentialIdGenerator::NewDealId() {
  std::lock_guard lock(mutex_);
  ++counter_;

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08llu", static_cast<unsigned long long>(counter_));
  return FormatId(base_date_, buf);
}

void SequentialIdGenerator::Reset() {
  std::lock_guard lock(mutex_);
  counter_ = 0;
}

} // namespace pipeline::context
