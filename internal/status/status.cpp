#include "status.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace rowqueue::status {

using util::TimePoint;
using util::ValidationError;

namespace {

constexpr int64_t kYearFactor   = 10'000'000'000'000; // 10^13
constexpr int64_t kMonthFactor  = 100'000'000'000;    // 10^11
constexpr int64_t kDayFactor    = 1'000'000'000;      // 10^9
constexpr int64_t kHourFactor   = 10'000'000;         // 10^7
constexpr int64_t kMinuteFactor = 100'000;            // 10^5
constexpr int64_t kSecondFactor = 1'000;

bool IsKnownState(State state) {
  const auto raw = static_cast<int>(state);
  return raw >= static_cast<int>(State::kCreated) && raw <= static_cast<int>(State::kCanceled);
}

void CheckState(State state) {
  if (!IsKnownState(state)) {
    throw ValidationError("invalid queue state " + std::to_string(static_cast<int>(state)));
  }
}

void CheckAttempts(int attempts) {
  if (attempts < 0 || attempts > kMaxAttempts) {
    throw ValidationError("attempts must be a single digit, got " + std::to_string(attempts));
  }
}

TimePoint NowOr(const std::optional<TimePoint>& priority) {
  return priority ? *priority : util::Now();
}

} // namespace

std::string_view ToString(State state) {
  switch (state) {
    case State::kCreated:
      return "created";
    case State::kWaiting:
      return "waiting";
    case State::kWorking:
      return "working";
    case State::kFinished:
      return "finished";
    case State::kCanceled:
      return "canceled";
  }
  return "unknown";
}

State ParseState(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto state : kAllStates) {
    if (lowered == ToString(state)) {
      return state;
    }
  }
  throw ValidationError("unknown queue state '" + std::string(name) + "'");
}

// ---------------------------------------------------------------------
// Priority digits
// ---------------------------------------------------------------------

int64_t EncodePriority(TimePoint tp) {
  using namespace std::chrono;

  const auto           ms  = floor<milliseconds>(tp);
  const auto           day = floor<days>(ms);
  const year_month_day ymd{day};
  const hh_mm_ss       hms{ms - day};

  const int year = static_cast<int>(ymd.year());
  if (year < 1 || year > 9999) {
    throw ValidationError("priority year " + std::to_string(year) + " is outside 0001..9999");
  }

  return static_cast<int64_t>(year) * kYearFactor + static_cast<int64_t>(static_cast<unsigned>(ymd.month())) * kMonthFactor +
         static_cast<int64_t>(static_cast<unsigned>(ymd.day())) * kDayFactor + static_cast<int64_t>(hms.hours().count()) * kHourFactor +
         static_cast<int64_t>(hms.minutes().count()) * kMinuteFactor + static_cast<int64_t>(hms.seconds().count()) * kSecondFactor +
         static_cast<int64_t>(hms.subseconds().count());
}

TimePoint DecodePriority(int64_t priority) {
  using namespace std::chrono;

  if (priority < 0 || priority >= kPriorityLimit) {
    throw ValidationError("priority " + std::to_string(priority) + " does not fit 17 digits");
  }

  const auto y      = static_cast<int>(priority / kYearFactor);
  const auto m      = static_cast<unsigned>(priority / kMonthFactor % 100);
  const auto d      = static_cast<unsigned>(priority / kDayFactor % 100);
  const auto hour   = priority / kHourFactor % 100;
  const auto minute = priority / kMinuteFactor % 100;
  const auto second = priority / kSecondFactor % 100;
  const auto milli  = priority % 1000;

  const year_month_day ymd{year{y}, month{m}, day{d}};
  if (y < 1 || !ymd.ok() || hour > 23 || minute > 59 || second > 59) {
    throw ValidationError("priority " + std::to_string(priority) + " is not a valid UTC timestamp");
  }

  const sys_time<milliseconds> decoded =
      sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second} + milliseconds{milli};

  if (decoded < time_point_cast<milliseconds>(TimePoint::min()) || decoded > time_point_cast<milliseconds>(TimePoint::max())) {
    throw ValidationError("priority " + std::to_string(priority) + " is outside the clock's range");
  }
  return time_point_cast<TimePoint::duration>(decoded);
}

// ---------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------

Status Status::Combine(State state, int64_t priority, int attempts) {
  CheckState(state);
  CheckAttempts(attempts);
  if (priority < 0 || priority >= kPriorityLimit) {
    throw ValidationError("priority " + std::to_string(priority) + " does not fit 17 digits");
  }
  return Status(static_cast<int64_t>(state) * kStateFactor + priority * kPriorityFactor + attempts);
}

Status Status::Combine(State state, TimePoint priority, int attempts) {
  return Combine(state, EncodePriority(priority), attempts);
}

Status Status::FromInteger(int64_t value) {
  if (value < Minimum(State::kCreated).value() || value > Maximum(State::kCanceled).value()) {
    throw ValidationError("status " + std::to_string(value) + " is not a 19 digit queue status");
  }
  return Status(value);
}

Status Status::Created(std::optional<TimePoint> priority, int attempts) {
  return Combine(State::kCreated, NowOr(priority), attempts);
}

Status Status::Waiting(std::optional<TimePoint> priority, int attempts) {
  return Combine(State::kWaiting, NowOr(priority), attempts);
}

Status Status::Working(std::optional<TimePoint> priority, int attempts) {
  return Combine(State::kWorking, NowOr(priority), attempts);
}

Status Status::Finished(std::optional<TimePoint> priority, int attempts) {
  return Combine(State::kFinished, NowOr(priority), attempts);
}

Status Status::Canceled(std::optional<TimePoint> priority, int attempts) {
  return Combine(State::kCanceled, NowOr(priority), attempts);
}

Status Status::Minimum(State state) {
  CheckState(state);
  return Status(static_cast<int64_t>(state) * kStateFactor);
}

Status Status::Maximum(State state) {
  CheckState(state);
  return Status((static_cast<int64_t>(state) + 1) * kStateFactor - 1);
}

StatusRange Status::Range(State state) {
  return {Minimum(state).value(), Maximum(state).value()};
}

State Status::state() const {
  return static_cast<State>(value_ / kStateFactor);
}

int64_t Status::priority() const {
  return value_ % kStateFactor / kPriorityFactor;
}

int Status::attempts() const {
  return static_cast<int>(value_ % kPriorityFactor);
}

ParsedStatus Status::Parse() const {
  return {state(), priority(), attempts()};
}

TimePoint Status::PriorityTime() const {
  return DecodePriority(priority());
}

std::string Status::ToString() const {
  return std::to_string(value_);
}

} // namespace rowqueue::status
