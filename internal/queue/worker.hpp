#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "runner.hpp"

namespace rowqueue::queue {

/*
  Background poll loop around a Runner.

  Calls Runner::Process() back to back while rows are available and sleeps
  idle_backoff after an empty poll. Job failures, whatever the job threw, are
  logged and the loop keeps going. Store errors are logged and treated like an
  empty poll. A ValidationError from the Runner stops the loop since every
  later call would fail the same way.
*/
class Worker {
 public:
  Worker(std::shared_ptr<Runner> runner, db::QueueColumn column, Action action, RunOptions options = {},
         std::chrono::milliseconds idle_backoff = std::chrono::seconds(1));
  ~Worker();

  Worker(const Worker&)            = delete;
  Worker& operator=(const Worker&) = delete;

  void Start();
  void Stop();

  // Runs on the calling thread until the queue has no eligible row. Returns
  // the number of rows processed, failed jobs included. Errors raised by the
  // Runner or the store (util::StoreError, util::NotFound,
  // util::ValidationError) are rethrown, whatever a job itself throws is not.
  uint64_t Drain();

  uint64_t Processed() const {
    return processed_.load();
  }

  uint64_t Failed() const {
    return failed_.load();
  }

 private:
  void Loop();

  enum class StepResult {
    kIdle,
    kProcessed,
    kFailed,
  };

  // One Runner::Process() call. Store errors and ValidationError propagate.
  StepResult Step();

  std::shared_ptr<Runner>   runner_;
  db::QueueColumn           column_;
  Action                    action_;
  RunOptions                options_;
  std::chrono::milliseconds idle_backoff_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable wake_;

  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace rowqueue::queue
