#include "system_context.hpp"

#include <stdexcept>

namespace pipeline::context {

SystemContext::SystemContext(std::shared_ptr<const Clock> clock, std::shared_ptr<IdGenerator> ids)
    : clock_(std::move(clock)), ids_(std::move(ids)) {
  if (!clock_ || !ids_) {
    throw std::invalid_argument("SystemContext requires a clock and an id generator");
  }
}

std::shared_ptr<SystemContext> SystemContext::Default() {
  auto clock = std::make_shared<SystemClock>();
  return std::make_shared<SystemContext>(clock, std::make_shared<RandomIdGenerator>(clock));
}

std::shared_ptr<SystemContext> SystemContext::ForTesting(util::Date fixed_date) {
  return std::make_shared<SystemContext>(std::make_shared<FixedClock>(fixed_date), std::make_shared<SequentialIdGenerator>(fixed_date));
}

std::shared_ptr<SystemContext> SystemContext::ForSyntheticData(util::Date fixed_date, uint64_t seed) {
  return std::make_shared<SystemContext>(std::make_shared<FixedClock>(fixed_date), std::make_shared<SeededIdGenerator>(seed, fixed_date));
}

} // namespace pipeline::context
