#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace rowqueue::status {

/*
  Queue status codec.

  One signed 64-bit integer, 19 decimal digits, most significant first:

      2  2018 03 27  14 43 25 759  0
       \    \  \  \    \  \  \  \   \
      state  \  \  \  hour \  \  \  attempts
            year \  \   minute \  \
               month \      second \
                     day       millisecond

  The state digit partitions statuses into contiguous ranges and, within a
  state, integer order equals (priority, attempts) order. The queue relies on
  both: "next row" is always "smallest status in a range".
*/

enum class State : std::uint8_t {
  kCreated  = 1,
  kWaiting  = 2,
  kWorking  = 3,
  kFinished = 4,
  kCanceled = 5,
};

inline constexpr State kAllStates[] = {State::kCreated, State::kWaiting, State::kWorking, State::kFinished, State::kCanceled};

inline constexpr int64_t kStateFactor    = 1'000'000'000'000'000'000; // 10^18
inline constexpr int64_t kPriorityFactor = 10;                         // priority sits above the attempts digit
inline constexpr int64_t kPriorityLimit  = 100'000'000'000'000'000;    // 10^17, exclusive
inline constexpr int     kMaxAttempts    = 9;
inline constexpr int     kMaxRetry       = kMaxAttempts - 1;

constexpr bool IsTerminal(State state) {
  return state == State::kFinished || state == State::kCanceled;
}

std::string_view ToString(State state);

// Accepts "created", "WAITING", ... (case-insensitive). Throws ValidationError.
State ParseState(std::string_view name);

// Inclusive bounds of all statuses carrying one state.
struct StatusRange {
  int64_t min = 0;
  int64_t max = 0;

  bool Contains(int64_t value) const {
    return min <= value && value <= max;
  }
};

struct ParsedStatus {
  State   state    = State::kCreated;
  int64_t priority = 0; // YYYYMMDDHHMMSSmmm
  int     attempts = 0;
};

class Status {
 public:
  // -------------------------------------------------------------------
  // Construction
  // -------------------------------------------------------------------

  static Status Combine(State state, int64_t priority, int attempts);
  static Status Combine(State state, util::TimePoint priority, int attempts);

  // Validates a stored integer (19 digits, known state digit).
  static Status FromInteger(int64_t value);

  static Status Created(std::optional<util::TimePoint> priority = std::nullopt, int attempts = 0);
  static Status Waiting(std::optional<util::TimePoint> priority = std::nullopt, int attempts = 0);
  static Status Working(std::optional<util::TimePoint> priority = std::nullopt, int attempts = 0);
  static Status Finished(std::optional<util::TimePoint> priority = std::nullopt, int attempts = 0);
  static Status Canceled(std::optional<util::TimePoint> priority = std::nullopt, int attempts = 0);

  // -------------------------------------------------------------------
  // Ranges
  // -------------------------------------------------------------------

  static Status      Minimum(State state);
  static Status      Maximum(State state);
  static StatusRange Range(State state);

  // -------------------------------------------------------------------
  // Accessors
  // -------------------------------------------------------------------

  int64_t value() const {
    return value_;
  }

  State   state() const;
  int64_t priority() const;
  int     attempts() const;

  ParsedStatus Parse() const;

  // Renders the priority digits as a UTC instant. Throws ValidationError when
  // they do not name a valid calendar time (e.g. scheduling sentinels).
  util::TimePoint PriorityTime() const;

  std::string ToString() const;

  friend auto operator<=>(const Status&, const Status&) = default;

 private:
  explicit Status(int64_t value) : value_(value) {
  }

  int64_t value_ = 0;
};

// Renders a time point as 17 priority digits, truncating to milliseconds.
int64_t EncodePriority(util::TimePoint tp);

util::TimePoint DecodePriority(int64_t priority);

} // namespace rowqueue::status
