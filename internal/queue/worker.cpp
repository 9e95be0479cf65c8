#include "worker.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::queue {

using observability::IntField;
using observability::StringField;

Worker::Worker(std::shared_ptr<Runner> runner, db::QueueColumn column, Action action, RunOptions options,
               std::chrono::milliseconds idle_backoff)
    : runner_(std::move(runner)),
      column_(std::move(column)),
      action_(std::move(action)),
      options_(options),
      idle_backoff_(idle_backoff) {
  if (!runner_) throw std::invalid_argument("Worker requires a runner");
  db::sql::CheckColumn(column_);
  ValidateRunOptions(options_);
}

Worker::~Worker() {
  Stop();
}

void Worker::Start() {
  if (running_.exchange(true)) return;
  // a loop that stopped on its own still needs joining
  if (thread_.joinable()) thread_.join();
  thread_ = std::thread(&Worker::Loop, this);
  ROWQUEUE_LOG_INFO("worker started", {StringField("table", column_.table), StringField("field", column_.field)});
}

void Worker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    ROWQUEUE_LOG_INFO("worker stopped", {StringField("table", column_.table), StringField("field", column_.field),
                                         IntField("processed", static_cast<int64_t>(processed_.load())),
                                         IntField("failed", static_cast<int64_t>(failed_.load()))});
  }
}

uint64_t Worker::Drain() {
  uint64_t count = 0;
  while (Step() != StepResult::kIdle) {
    ++count;
  }
  return count;
}

Worker::StepResult Worker::Step() {
  auto processed = runner_->Process(column_, action_, options_);
  if (!processed) {
    return StepResult::kIdle;
  }
  ++processed_;
  if (!processed->error) {
    return StepResult::kProcessed;
  }

  // The row is already requeued or canceled; only the job failed.
  ++failed_;
  ROWQUEUE_LOG_ERROR("job failed", {StringField("table", column_.table), StringField("field", column_.field), IntField("id", processed->row.id),
                                    StringField("error", util::Describe(processed->error))});
  return StepResult::kFailed;
}

void Worker::Loop() {
  while (running_) {
    auto result = StepResult::kIdle;
    try {
      result = Step();
    } catch (const util::ValidationError& e) {
      ROWQUEUE_LOG_ERROR("worker stopping on invalid configuration", {StringField("error", e.what())});
      running_ = false;
      break;
    } catch (const std::exception& e) {
      ROWQUEUE_LOG_ERROR("queue store error", {StringField("table", column_.table), StringField("field", column_.field),
                                               StringField("error", e.what())});
    }

    if (result != StepResult::kIdle) continue;

    std::unique_lock lock(mutex_);
    wake_.wait_for(lock, idle_backoff_, [this] { return !running_.load(); });
  }
}

} // namespace rowqueue::queue
