#pragma once

#include <chrono>
#include <memory>
#include <mutex>

namespace rowqueue::util {

/*
  Time utilities. Single place to control the clock source.

  The queue never reads the wall clock directly; it asks an injected Clock.
  Tests use ManualClock to get deterministic timestamps.
*/

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

TimePoint Now();

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Set(TimePoint now);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

std::shared_ptr<const Clock> DefaultClock();

} // namespace rowqueue::util
