#include "internal/queue/runner.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/tally.hpp"
#include "internal/status/status.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using rowqueue::db::QueueColumn;
using rowqueue::db::memory::MemoryRepository;
using rowqueue::db::model::RowRecord;
using rowqueue::queue::AbortWith;
using rowqueue::queue::Cancel;
using rowqueue::queue::InterruptPolicy;
using rowqueue::queue::Outcome;
using rowqueue::queue::RetryWith;
using rowqueue::queue::RunOptions;
using rowqueue::queue::Runner;
using rowqueue::queue::Success;
using rowqueue::status::State;
using rowqueue::status::Status;
using rowqueue::util::ManualClock;
using rowqueue::util::TimePoint;

TimePoint Start() {
  using namespace std::chrono;
  return sys_days{year{2018} / 3 / 27} + hours{14} + minutes{43} + seconds{25} + milliseconds{759};
}

struct Fixture {
  QueueColumn                       column{.table = "tasks", .field = "status"};
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(Start());
  Runner                            runner{repo, clock};

  Fixture() {
    auto tx = repo->Begin();
    assert(repo->EnsureQueueTable(*tx, column));
    tx->Commit();
  }

  int64_t Insert(Status status) {
    RowRecord row{.status = status.value()};
    auto      tx = repo->Begin();
    assert(repo->InsertRow(*tx, column, row));
    tx->Commit();
    return row.id;
  }

  Status Read(int64_t id) {
    auto tx  = repo->Begin();
    auto row = repo->GetRow(*tx, column, id);
    tx->Commit();
    assert(row.has_value());
    return Status::FromInteger(row->status);
  }

  TimePoint Now() const {
    return clock->Now();
  }
};

Outcome Succeed(RowRecord&) {
  return Success{};
}

void TestEmptyQueueReturnsNone() {
  Fixture f;
  bool    called = false;
  auto    result = f.runner.Run(f.column, [&](RowRecord&) -> Outcome {
    called = true;
    return Success{};
  });
  assert(!result.has_value());
  assert(!called);
}

void TestDefaultRowFinishes() {
  Fixture f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  int64_t seen = 0;
  auto    result = f.runner.Run(f.column, [&](RowRecord& row) -> Outcome {
    seen = row.id;
    // claimed rows are WORKING while the job runs
    assert(Status::FromInteger(row.status).state() == State::kWorking);
    return Success{};
  });

  assert(result.has_value());
  assert(seen == id);
  assert(result->id == id);
  assert(result->status == Status::Finished(f.Now(), 1).value());
  assert(f.Read(id) == Status::Finished(f.Now(), 1));
}

void TestCreatedRowsAreNeverClaimed() {
  Fixture f;
  const auto id = f.Insert(Status::Created(f.Now() - 1h));

  assert(!f.runner.Run(f.column, Succeed).has_value());
  assert(f.Read(id).state() == State::kCreated);
}

void TestOldestRowFirst() {
  Fixture f;
  const auto newer = f.Insert(Status::Waiting(f.Now() - 1s));
  const auto older = f.Insert(Status::Waiting(f.Now() - 2s));

  assert(f.runner.Run(f.column, Succeed)->id == older);
  assert(f.runner.Run(f.column, Succeed)->id == newer);
  assert(!f.runner.Run(f.column, Succeed).has_value());
}

void TestFutureRowWaitsForItsTime() {
  Fixture f;
  const auto id = f.Insert(Status::Waiting(f.Now() + 1h));

  assert(!f.runner.Run(f.column, Succeed).has_value());
  assert(f.Read(id).state() == State::kWaiting);

  f.clock->Advance(1h);
  auto result = f.runner.Run(f.column, Succeed);
  assert(result.has_value());
  assert(result->id == id);
}

void TestRetrySignalKeepsAttempts() {
  Fixture f;
  const auto id = f.Insert(Status::Waiting(f.Now(), 2));

  auto result = f.runner.Run(f.column, [](RowRecord&) -> Outcome { return RetryWith{}; });
  assert(result.has_value());
  assert(f.Read(id) == Status::Waiting(f.Now(), 2));

  f.runner.Run(f.column, [](RowRecord&) -> Outcome { return RetryWith{30s}; });
  assert(f.Read(id) == Status::Waiting(f.Now() + 30s, 2));
  assert(!f.runner.Run(f.column, Succeed).has_value());

  f.clock->Advance(30s);
  assert(f.runner.Run(f.column, Succeed)->id == id);
  assert(f.Read(id) == Status::Finished(f.Now(), 3));
}

void TestAbortConsumesBudget() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  RunOptions options;
  options.retry = 2;

  auto abort_job = [](RowRecord&) -> Outcome { return AbortWith{}; };

  f.runner.Run(f.column, abort_job, options);
  assert(f.Read(id) == Status::Waiting(f.Now(), 1));

  f.runner.Run(f.column, abort_job, options);
  assert(f.Read(id) == Status::Waiting(f.Now(), 2));

  auto last = f.runner.Run(f.column, abort_job, options);
  assert(last.has_value());
  assert(f.Read(id) == Status::Canceled(f.Now(), 3));

  assert(!f.runner.Run(f.column, abort_job, options).has_value());
}

void TestAbortDelayOverride() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  RunOptions options;
  options.delay = 5s;

  f.runner.Run(f.column, [](RowRecord&) -> Outcome { return AbortWith{}; }, options);
  assert(f.Read(id) == Status::Waiting(f.Now() + 5s, 1));

  f.clock->Advance(5s);
  f.runner.Run(f.column, [](RowRecord&) -> Outcome { return AbortWith{2min}; }, options);
  assert(f.Read(id) == Status::Waiting(f.Now() + 2min, 2));
}

void TestCancelSignal() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  f.runner.Run(f.column, [](RowRecord&) -> Outcome { return Cancel{}; });
  assert(f.Read(id) == Status::Canceled(f.Now(), 1));
}

void TestFaultIsStoredThenRethrown() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  RunOptions options;
  options.retry = 3;

  auto fail = [](RowRecord&) -> Outcome { throw std::runtime_error("boom"); };

  for (int attempt = 1; attempt <= 4; ++attempt) {
    bool threw = false;
    try {
      f.runner.Run(f.column, fail, options);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()) == "boom";
    }
    assert(threw);

    const auto stored = f.Read(id);
    assert(stored.attempts() == attempt);
    assert(stored.state() == (attempt <= 3 ? State::kWaiting : State::kCanceled));
  }

  assert(!f.runner.Run(f.column, Succeed, options).has_value());
}

void TestFaultOutcomeWithError() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  bool threw = false;
  try {
    f.runner.Run(f.column, [](RowRecord&) -> Outcome {
      return rowqueue::queue::Fault{std::make_exception_ptr(std::logic_error("bad input"))};
    });
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.Read(id) == Status::Waiting(f.Now(), 1));
}

void TestInterruptPolicies() {
  auto interrupt = [](RowRecord&) -> Outcome { throw rowqueue::util::Interrupted(); };

  {
    Fixture    f;
    const auto id = f.Insert(Status::Waiting(f.Now()));

    bool threw = false;
    try {
      f.runner.Run(f.column, interrupt);
    } catch (const rowqueue::util::Interrupted&) {
      threw = true;
    }
    assert(threw);
    assert(f.Read(id) == Status::Waiting(f.Now(), 1));
  }

  {
    Fixture    f;
    const auto id = f.Insert(Status::Waiting(f.Now()));

    RunOptions options;
    options.interrupt_policy = InterruptPolicy::kCancel;

    bool threw = false;
    try {
      f.runner.Run(f.column, interrupt, options);
    } catch (const rowqueue::util::Interrupted&) {
      threw = true;
    }
    assert(threw);
    assert(f.Read(id) == Status::Canceled(f.Now(), 1));
  }
}

void TestStaleLeaseIsReclaimedAndFinished() {
  Fixture    f;
  const auto id = f.Insert(Status::Working(f.Now() - 2h, 1));

  auto result = f.runner.Run(f.column, Succeed);
  assert(result.has_value());
  assert(result->id == id);
  assert(f.Read(id) == Status::Finished(f.Now(), 3));
}

void TestReclaimRunsBeforeClaim() {
  Fixture    f;
  const auto stale   = f.Insert(Status::Working(f.Now() - 2h));
  const auto waiting = f.Insert(Status::Waiting(f.Now() - 10s));

  RunOptions options;
  options.delay = 1min;

  auto result = f.runner.Run(f.column, Succeed, options);
  assert(result.has_value());
  assert(result->id == waiting);

  // reclaimed with the delay, so it is not eligible yet
  assert(f.Read(stale) == Status::Waiting(f.Now() + 1min, 1));
  assert(!f.runner.Run(f.column, Succeed, options).has_value());
}

void TestOneReclaimPerCallOldestFirst() {
  Fixture    f;
  const auto newer = f.Insert(Status::Working(f.Now() - 2h));
  const auto older = f.Insert(Status::Working(f.Now() - 3h));

  // the delay keeps reclaimed rows out of this call's claim step
  RunOptions options;
  options.delay = 1min;

  assert(!f.runner.Run(f.column, Succeed, options).has_value());
  assert(f.Read(older) == Status::Waiting(f.Now() + 1min, 1));
  assert(f.Read(newer) == Status::Working(f.Now() - 2h));

  assert(!f.runner.Run(f.column, Succeed, options).has_value());
  assert(f.Read(newer) == Status::Waiting(f.Now() + 1min, 1));
}

void TestFreshLeaseIsLeftAlone() {
  Fixture    f;
  const auto lease = f.Insert(Status::Working(f.Now() - 59min));

  assert(!f.runner.Run(f.column, Succeed).has_value());
  assert(f.Read(lease) == Status::Working(f.Now() - 59min));

  f.clock->Advance(1min);
  assert(f.runner.Run(f.column, Succeed)->id == lease);
}

void TestReclaimPastBudgetCancels() {
  Fixture    f;
  const auto id = f.Insert(Status::Working(f.Now() - 2h, 3));

  RunOptions options;
  options.retry = 3;

  assert(!f.runner.Run(f.column, Succeed, options).has_value());
  assert(f.Read(id) == Status::Canceled(f.Now(), 4));
}

void TestAttemptsSaturate() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now(), 9));

  f.runner.Run(f.column, Succeed);
  assert(f.Read(id) == Status::Finished(f.Now(), 9));
}

void TestInvalidOptionsAndIdentifiers() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  auto rejects = [&](const QueueColumn& column, const RunOptions& options) {
    try {
      f.runner.Run(column, Succeed, options);
    } catch (const rowqueue::util::ValidationError&) {
      return true;
    }
    return false;
  };

  RunOptions too_many;
  too_many.retry = 9;
  assert(rejects(f.column, too_many));

  RunOptions negative_timeout;
  negative_timeout.timeout = -1ms;
  assert(rejects(f.column, negative_timeout));

  RunOptions negative_delay;
  negative_delay.delay = -1ms;
  assert(rejects(f.column, negative_delay));

  // past the time point range
  RunOptions huge_timeout;
  huge_timeout.timeout = 24h * 365 * 1000;
  assert(rejects(f.column, huge_timeout));

  RunOptions huge_delay;
  huge_delay.delay = rowqueue::queue::kMaxDuration + 1ms;
  assert(rejects(f.column, huge_delay));

  RunOptions longest;
  longest.timeout = rowqueue::queue::kMaxDuration;
  longest.delay   = rowqueue::queue::kMaxDuration;
  rowqueue::queue::ValidateRunOptions(longest);

  assert(rejects(QueueColumn{.table = "tasks; DROP TABLE tasks", .field = "status"}, RunOptions{}));
  assert(rejects(QueueColumn{.table = "tasks", .field = "1status"}, RunOptions{}));

  // nothing was touched
  assert(f.Read(id) == Status::Waiting(Start()));
}

void TestOutOfRangeJobDelayIsAFault() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  bool threw = false;
  try {
    f.runner.Run(f.column, [](RowRecord&) -> Outcome { return AbortWith{24h * 365 * 1000}; });
  } catch (const rowqueue::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  // resolved like a fault: attempt counted, default delay
  assert(f.Read(id) == Status::Waiting(f.Now(), 1));
}

void TestProcessReturnsJobFailures() {
  Fixture    f;
  const auto id = f.Insert(Status::Waiting(f.Now()));

  auto processed = f.runner.Process(f.column, [](RowRecord&) -> Outcome { throw rowqueue::util::ValidationError("bad payload"); });
  assert(processed.has_value());
  assert(processed->row.id == id);
  assert(processed->error != nullptr);
  assert(rowqueue::util::Describe(processed->error) == "bad payload");
  assert(f.Read(id) == Status::Waiting(f.Now(), 1));

  processed = f.runner.Process(f.column, Succeed);
  assert(processed.has_value());
  assert(!processed->error);
  assert(f.Read(id) == Status::Finished(f.Now(), 2));

  assert(!f.runner.Process(f.column, Succeed).has_value());
}

void TestTally() {
  Fixture f;
  f.Insert(Status::Created(f.Now()));
  f.Insert(Status::Waiting(f.Now()));
  f.Insert(Status::Waiting(f.Now() + 1h));
  f.Insert(Status::Finished(f.Now(), 1));

  const auto counts = rowqueue::queue::Tally(*f.repo, "tasks", "status");
  assert(counts.size() == 5);
  assert(counts.at(State::kCreated) == 1);
  assert(counts.at(State::kWaiting) == 2);
  assert(counts.at(State::kWorking) == 0);
  assert(counts.at(State::kFinished) == 1);
  assert(counts.at(State::kCanceled) == 0);
}

} // namespace

int main() {
  TestEmptyQueueReturnsNone();
  TestDefaultRowFinishes();
  TestCreatedRowsAreNeverClaimed();
  TestOldestRowFirst();
  TestFutureRowWaitsForItsTime();
  TestRetrySignalKeepsAttempts();
  TestAbortConsumesBudget();
  TestAbortDelayOverride();
  TestCancelSignal();
  TestFaultIsStoredThenRethrown();
  TestFaultOutcomeWithError();
  TestInterruptPolicies();
  TestStaleLeaseIsReclaimedAndFinished();
  TestReclaimRunsBeforeClaim();
  TestOneReclaimPerCallOldestFirst();
  TestFreshLeaseIsLeftAlone();
  TestReclaimPastBudgetCancels();
  TestAttemptsSaturate();
  TestInvalidOptionsAndIdentifiers();
  TestOutOfRangeJobDelayIsAFault();
  TestProcessReturnsJobFailures();
  TestTally();

  std::cout << "rowqueue_unit_runner: pass\n";
  return 0;
}
