#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/context/clock.hpp"
#include "internal/context/id_generator.hpp"

namespace pipeline::context {

/*
  SystemContext

  The single injection point for time and identifier generation.
  Normalization and the durable store take one of these; swapping it
  switches the whole write path between live and replayable modes.
*/
class SystemContext {
 public:
  SystemContext(std::shared_ptr<const Clock> clock, std::shared_ptr<IdGenerator> ids);

  // System clock, random identifiers.
  static std::shared_ptr<SystemContext> Default();

  // Fixed clock, sequential identifiers dated at `fixed_date`.
  static std::shared_ptr<SystemContext> ForTesting(util::Date fixed_date);

  // Fixed clock, seeded identifiers spread over the year after `fixed_date`.
  static std::shared_ptr<SystemContext> ForSyntheticData(util::Date fixed_date, uint64_t seed);

  const Clock& TimeSource() const {
    return *clock_;
  }

  IdGenerator& IdSource() const {
    return *ids_;
  }

  util::TimePoint Now() const {
    return clock_->Now();
  }

  util::Date Today() const {
    return clock_->Today();
  }

  std::string NewDealId() const {
    return ids_->NewDealId();
  }

 private:
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<IdGenerator> ids_;
};

} // namespace pipeline::context
