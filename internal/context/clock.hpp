#pragma once

#include <mutex>

#include "internal/util/time.hpp"

namespace pipeline::context {

/*
  Source of "now" for everything on the write path.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual util::TimePoint Now() const = 0;

  util::Date Today() const {
    return util::ToDate(Now());
  }
};

class SystemClock final : public Clock {
 public:
  util::TimePoint Now() const override {
    return util::Now();
  }
};

/*
  Clock frozen at a fixed instant. Tests move it explicitly.
*/
class FixedClock final : public Clock {
 public:
  explicit FixedClock(util::TimePoint now) : now_(now) {
  }

  explicit FixedClock(util::Date today) : now_(util::FromDate(today)) {
  }

  util::TimePoint Now() const override {
    std::lock_guard lock(mutex_);
    return now_;
  }

  void Set(util::TimePoint now) {
    std::lock_guard lock(mutex_);
    now_ = now;
  }

  void Advance(util::Clock::duration delta) {
    std::lock_guard lock(mutex_);
    now_ += delta;
  }

 private:
  mutable std::mutex mutex_;
  util::TimePoint    now_;
};

} // namespace pipeline::context
