#include "runner.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/status/status.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::queue {

using db::model::RowRecord;
using observability::IntField;
using observability::StringField;
using status::State;
using status::Status;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// The attempts digit saturates; a row already at 9 stays at 9.
int NextAttempt(int attempts) {
  return std::min(attempts + 1, status::kMaxAttempts);
}

bool IsInterrupt(const std::exception_ptr& error) {
  if (!error) return false;
  try {
    std::rethrow_exception(error);
  } catch (const util::Interrupted&) {
    return true;
  } catch (...) {
    return false;
  }
}

// A delay supplied by the job has the same bounds as RunOptions::delay; one
// outside them turns the outcome into a fault.
std::exception_ptr CheckOutcomeDelay(const Outcome& outcome) {
  std::optional<std::chrono::milliseconds> delay;
  if (const auto* retry = std::get_if<RetryWith>(&outcome)) {
    delay = retry->delay;
  } else if (const auto* aborted = std::get_if<AbortWith>(&outcome)) {
    delay = aborted->delay;
  }
  if (!delay || (delay->count() >= 0 && *delay <= kMaxDuration)) {
    return nullptr;
  }
  return std::make_exception_ptr(util::ValidationError("job returned delay " + std::to_string(delay->count()) +
                                                       "ms, must be within 0.." + std::to_string(kMaxDuration.count()) + "h"));
}

// Penalized requeue shared by reclaim, abort and fault.
Status Requeue(int attempts, util::TimePoint now, std::chrono::milliseconds delay, int retry) {
  if (attempts <= retry) {
    return Status::Combine(State::kWaiting, now + delay, attempts);
  }
  return Status::Combine(State::kCanceled, now, attempts);
}

} // namespace

void ValidateRunOptions(const RunOptions& options) {
  if (options.retry < 0 || options.retry > status::kMaxRetry) {
    throw util::ValidationError("retry must be within 0.." + std::to_string(status::kMaxRetry) + ", got " + std::to_string(options.retry));
  }
  if (options.timeout.count() < 0 || options.timeout > kMaxDuration) {
    throw util::ValidationError("timeout must be within 0.." + std::to_string(kMaxDuration.count()) + "h");
  }
  if (options.delay.count() < 0 || options.delay > kMaxDuration) {
    throw util::ValidationError("delay must be within 0.." + std::to_string(kMaxDuration.count()) + "h");
  }
}

Runner::Runner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("Runner requires a repository");
  if (!clock_) throw std::invalid_argument("Runner requires a clock");
}

std::optional<RowRecord> Runner::Run(const std::string& rows, const std::string& field, const Action& action, const RunOptions& options) {
  return Run(db::QueueColumn{.table = rows, .field = field}, action, options);
}

std::optional<RowRecord> Runner::Run(const db::QueueColumn& column, const Action& action, const RunOptions& options) {
  auto processed = Process(column, action, options);
  if (!processed) {
    return std::nullopt;
  }
  if (processed->error) {
    std::rethrow_exception(processed->error);
  }
  return processed->row;
}

std::optional<Processed> Runner::Process(const db::QueueColumn& column, const Action& action, const RunOptions& options) {
  db::sql::CheckColumn(column);
  ValidateRunOptions(options);
  if (!action) throw util::ValidationError("action must be callable");

  auto claim = ClaimNext(column, options);
  if (!claim) {
    return std::nullopt;
  }

  // ---------------------------------------------------------------------
  // Phase B: run the job outside any transaction
  // ---------------------------------------------------------------------
  Outcome outcome;
  try {
    auto row = claim->row;
    outcome  = action(row);
  } catch (...) {
    outcome = Fault{std::current_exception()};
  }

  if (auto invalid = CheckOutcomeDelay(outcome)) {
    outcome = Fault{invalid};
  }
  if (auto* fault = std::get_if<Fault>(&outcome); fault && !fault->error) {
    fault->error = std::make_exception_ptr(std::runtime_error("job on " + column.table + "." + column.field + " row " +
                                                              std::to_string(claim->row.id) + " reported a fault without an error"));
  }

  Processed processed{.row = Resolve(column, *claim, outcome, options)};
  if (const auto* fault = std::get_if<Fault>(&outcome)) {
    processed.error = fault->error;
  }
  return processed;
}

// -----------------------------------------------------------------------
// Phase A: reclaim one stale lease, then claim the next waiting row
// -----------------------------------------------------------------------

std::optional<Runner::Claim> Runner::ClaimNext(const db::QueueColumn& column, const RunOptions& options) {
  auto       tx  = repository_->Begin();
  const auto now = clock_->Now();

  // The boundary carries the top attempts digit so that every lease started
  // at or before (now - timeout) is included whatever its attempt count.
  const auto stale_before = Status::Combine(State::kWorking, now - options.timeout, status::kMaxAttempts);
  if (auto stale = repository_->LockFirstInRange(*tx, column, {Status::Minimum(State::kWorking).value(), stale_before.value()})) {
    const auto lease    = Status::FromInteger(stale->status);
    const int  attempts = NextAttempt(lease.attempts());
    const auto next     = Requeue(attempts, now, options.delay, options.retry);

    stale->status = next.value();
    util::ThrowIfDbError(repository_->UpdateStatus(*tx, column, *stale), "reclaim expired lease");

    ROWQUEUE_LOG_INFO("reclaimed expired lease",
                      {StringField("table", column.table), StringField("field", column.field), IntField("id", stale->id),
                       StringField("state", status::ToString(next.state())), IntField("attempts", attempts)});
  }

  const auto eligible = Status::Combine(State::kWaiting, now, status::kMaxAttempts);
  auto       row      = repository_->LockFirstInRange(*tx, column, {Status::Minimum(State::kWaiting).value(), eligible.value()});
  if (!row) {
    tx->Commit();
    return std::nullopt;
  }

  const int attempts = Status::FromInteger(row->status).attempts();
  row->status        = Status::Combine(State::kWorking, now, attempts).value();
  util::ThrowIfDbError(repository_->UpdateStatus(*tx, column, *row), "claim row");
  tx->Commit();

  ROWQUEUE_LOG_DEBUG("claimed row", {StringField("table", column.table), StringField("field", column.field), IntField("id", row->id),
                                     IntField("attempts", attempts)});
  return Claim{.row = *row, .attempts = attempts};
}

// -----------------------------------------------------------------------
// Resolution
// -----------------------------------------------------------------------

RowRecord Runner::Resolve(const db::QueueColumn& column, const Claim& claim, const Outcome& outcome, const RunOptions& options) {
  const auto now     = clock_->Now();
  const int  counted = NextAttempt(claim.attempts);

  const auto next = std::visit(
      Overloaded{
          [&](const Success&) { return Status::Combine(State::kFinished, now, counted); },
          [&](const RetryWith& retry) { return Status::Combine(State::kWaiting, now + retry.delay.value_or(options.delay), claim.attempts); },
          [&](const AbortWith& aborted) { return Requeue(counted, now, aborted.delay.value_or(options.delay), options.retry); },
          [&](const Cancel&) { return Status::Combine(State::kCanceled, now, counted); },
          [&](const Fault& fault) {
            if (options.interrupt_policy == InterruptPolicy::kCancel && IsInterrupt(fault.error)) {
              return Status::Combine(State::kCanceled, now, counted);
            }
            return Requeue(counted, now, options.delay, options.retry);
          },
      },
      outcome);

  RowRecord row = claim.row;
  row.status    = next.value();

  auto tx = repository_->Begin();
  util::ThrowIfDbError(repository_->UpdateStatus(*tx, column, row), "resolve row");
  tx->Commit();

  const std::initializer_list<observability::LogField> fields = {
      StringField("table", column.table), StringField("field", column.field), IntField("id", row.id),
      StringField("state", status::ToString(next.state())), IntField("attempts", next.attempts())};

  if (const auto* fault = std::get_if<Fault>(&outcome)) {
    ROWQUEUE_LOG_WARN("job failed: " + util::Describe(fault->error), fields);
  } else if (next.state() == State::kCanceled) {
    ROWQUEUE_LOG_WARN("job canceled", fields);
  } else {
    ROWQUEUE_LOG_DEBUG("job resolved", fields);
  }
  return row;
}

} // namespace rowqueue::queue
