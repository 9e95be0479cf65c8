#include "internal/status/status.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using rowqueue::status::DecodePriority;
using rowqueue::status::EncodePriority;
using rowqueue::status::ParseState;
using rowqueue::status::State;
using rowqueue::status::Status;
using rowqueue::util::TimePoint;
using rowqueue::util::ValidationError;

// 2018-03-27T14:43:25.759Z
TimePoint Reference() {
  using namespace std::chrono;
  return sys_days{year{2018} / 3 / 27} + hours{14} + minutes{43} + seconds{25} + milliseconds{759};
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestDigitLayout() {
  assert(EncodePriority(Reference()) == 20180327144325759LL);

  const auto waiting = Status::Combine(State::kWaiting, Reference(), 0);
  assert(waiting.value() == 2201803271443257590LL);
  assert(waiting.ToString() == "2201803271443257590");

  const auto working = Status::Combine(State::kWorking, Reference(), 7);
  assert(working.value() == 3201803271443257597LL);
}

void TestParseRoundTrip() {
  for (const auto state : rowqueue::status::kAllStates) {
    for (int attempts = 0; attempts <= rowqueue::status::kMaxAttempts; attempts += 3) {
      const auto parsed = Status::Combine(state, Reference(), attempts).Parse();
      assert(parsed.state == state);
      assert(parsed.priority == 20180327144325759LL);
      assert(parsed.attempts == attempts);
    }
  }

  const auto status = Status::Combine(State::kFinished, Reference(), 4);
  assert(status.PriorityTime() == Reference());
  assert(Status::FromInteger(status.value()) == status);
}

void TestSubMillisecondTruncation() {
  const auto fine = Reference() + std::chrono::microseconds(999);
  assert(Status::Combine(State::kWaiting, fine, 0) == Status::Combine(State::kWaiting, Reference(), 0));
  assert(Status::Combine(State::kWaiting, fine, 0).PriorityTime() == Reference());
}

void TestOrderingWithinState() {
  const auto earlier = Reference();
  const auto later   = Reference() + std::chrono::milliseconds(1);

  assert(Status::Waiting(earlier, 9) < Status::Waiting(later, 0));
  assert(Status::Waiting(earlier, 1) < Status::Waiting(earlier, 2));
  assert(Status::Waiting(later, 0) < Status::Working(earlier, 0));
}

void TestRanges() {
  assert(Status::Minimum(State::kCreated).value() == 1'000'000'000'000'000'000LL);
  assert(Status::Maximum(State::kCreated).value() == 1'999'999'999'999'999'999LL);
  assert(Status::Maximum(State::kCanceled).value() == 5'999'999'999'999'999'999LL);

  for (const auto state : rowqueue::status::kAllStates) {
    const auto range = Status::Range(state);
    assert(range.Contains(Status::Combine(state, Reference(), 0).value()));
    assert(range.Contains(Status::Combine(state, 0, 0).value()));
    assert(range.Contains(Status::Combine(state, rowqueue::status::kPriorityLimit - 1, 9).value()));

    for (const auto other : rowqueue::status::kAllStates) {
      if (other == state) continue;
      const auto other_range = Status::Range(other);
      assert(range.max < other_range.min || other_range.max < range.min);
    }
  }
}

void TestStateHelpers() {
  assert(Status::Created(Reference()).state() == State::kCreated);
  assert(Status::Waiting(Reference()).state() == State::kWaiting);
  assert(Status::Working(Reference(), 2).attempts() == 2);
  assert(Status::Finished(Reference(), 3).state() == State::kFinished);
  assert(Status::Canceled(Reference()).priority() == 20180327144325759LL);

  // default priority is the wall clock
  const auto before = std::chrono::floor<std::chrono::milliseconds>(rowqueue::util::Now());
  const auto now    = Status::Waiting();
  assert(now.state() == State::kWaiting);
  assert(now.attempts() == 0);
  assert(now.PriorityTime() >= before);

  assert(rowqueue::status::IsTerminal(State::kFinished));
  assert(rowqueue::status::IsTerminal(State::kCanceled));
  assert(!rowqueue::status::IsTerminal(State::kWorking));
}

void TestStateNames() {
  assert(rowqueue::status::ToString(State::kWaiting) == "waiting");
  assert(ParseState("CANCELED") == State::kCanceled);
  assert(ParseState("working") == State::kWorking);
  assert(ThrowsValidation([] { (void)ParseState("paused"); }));
}

void TestValidation() {
  assert(ThrowsValidation([] { (void)Status::Combine(State::kWaiting, Reference(), 10); }));
  assert(ThrowsValidation([] { (void)Status::Combine(State::kWaiting, Reference(), -1); }));
  assert(ThrowsValidation([] { (void)Status::Combine(State::kWaiting, int64_t{-1}, 0); }));
  assert(ThrowsValidation([] { (void)Status::Combine(State::kWaiting, rowqueue::status::kPriorityLimit, 0); }));
  assert(ThrowsValidation([] { (void)Status::Combine(static_cast<State>(6), Reference(), 0); }));
  assert(ThrowsValidation([] { (void)Status::Combine(static_cast<State>(0), Reference(), 0); }));

  assert(ThrowsValidation([] { (void)Status::FromInteger(999'999'999'999'999'999LL); }));
  assert(ThrowsValidation([] { (void)Status::FromInteger(6'000'000'000'000'000'000LL); }));
  assert(ThrowsValidation([] { (void)Status::FromInteger(-1); }));
}

void TestPriorityTimeRejectsNonCalendarDigits() {
  // month 13
  assert(ThrowsValidation([] { (void)DecodePriority(20181327000000000LL); }));
  // Feb 30
  assert(ThrowsValidation([] { (void)DecodePriority(20180230000000000LL); }));
  // hour 24
  assert(ThrowsValidation([] { (void)DecodePriority(20180327240000000LL); }));
  // year 0: the CREATED sentinel written for new columns
  assert(ThrowsValidation([] { (void)Status::Minimum(State::kCreated).PriorityTime(); }));
}

} // namespace

int main() {
  TestDigitLayout();
  TestParseRoundTrip();
  TestSubMillisecondTruncation();
  TestOrderingWithinState();
  TestRanges();
  TestStateHelpers();
  TestStateNames();
  TestValidation();
  TestPriorityTimeRejectsNonCalendarDigits();

  std::cout << "rowqueue_unit_status: pass\n";
  return 0;
}
