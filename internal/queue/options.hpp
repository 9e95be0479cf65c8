#pragma once

#include <chrono>

namespace rowqueue::queue {

// How an util::Interrupted fault is resolved. Either way the interrupt is
// rethrown to the caller once the row is stored.
enum class InterruptPolicy {
  kPenalize, // same as any fault: retried while the budget lasts
  kCancel,   // canceled immediately
};

// Upper bound for timeout and delay values. Time points count nanoseconds,
// so anything much longer overflows when added to "now".
inline constexpr std::chrono::hours kMaxDuration{24 * 365 * 200};

struct RunOptions {
  // Abort/fault/timeout retries before a row is canceled. 0..8.
  int retry = 3;

  // Age after which a WORKING lease is considered dead and reclaimed.
  // At most kMaxDuration, like delay.
  std::chrono::milliseconds timeout = std::chrono::hours(1);

  // Added to "now" when a row goes back to WAITING.
  std::chrono::milliseconds delay = std::chrono::milliseconds(0);

  InterruptPolicy interrupt_policy = InterruptPolicy::kPenalize;
};

// Throws util::ValidationError.
void ValidateRunOptions(const RunOptions& options);

} // namespace rowqueue::queue
