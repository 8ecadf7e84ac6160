#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "internal/context/clock.hpp"

namespace pipeline::context {

/*
  Deal identifier strategies.

  All strategies produce "D-{yyyyMMdd}-{suffix}".
*/
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  virtual std::string NewDealId() = 0;
};

// Date from the clock, random hex suffix. Unique, not reproducible.
class RandomIdGenerator final : public IdGenerator {
 public:
  explicit RandomIdGenerator(std::shared_ptr<const Clock> clock);

  std::string NewDealId() override;

 private:
  std::shared_ptr<const Clock> clock_;
};

/*
  Reproducible sequence for a fixed seed.

  The raw mt19937_64 output is consumed directly (no std::*_distribution)
  so the sequence is identical across standard library implementations.
*/
class SeededIdGenerator final : public IdGenerator {
 public:
  explicit SeededIdGenerator(uint64_t seed, util::Date base_date = util::Date{std::chrono::year{2025}, std::chrono::January, std::chrono::day{1}});

  std::string NewDealId() override;

 private:
  std::mutex      mutex_;
  std::mt19937_64 rng_;
  util::Date      base_date_;
};

// D-{base}-00000001, D-{base}-00000002, ...
class SequentialIdGenerator final : public IdGenerator {
 public:
  explicit SequentialIdGenerator(util::Date base_date = util::Date{std::chrono::year{2025}, std::chrono::January, std::chrono::day{1}});

  std::string NewDealId() override;

  void Reset();

 private:
  std::mutex mutex_;
  util::Date base_date_;
  uint64_t   counter_ = 0;
};

} // namespace pipeline::context
