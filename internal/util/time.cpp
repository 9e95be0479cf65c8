#include "time.hpp"

namespace rowqueue::util {

TimePoint Now() {
  return WallClock::now();
}

TimePoint SystemClock::Now() const {
  return WallClock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint now) {
  std::lock_guard lock(mutex_);
  now_ = now;
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

std::shared_ptr<const Clock> DefaultClock() {
  static const auto clock = std::make_shared<SystemClock>();
  return clock;
}

} // namespace rowqueue::util
