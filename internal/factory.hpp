#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/queue/runner.hpp"

namespace rowqueue::factory {

/*
  Runtime

  Everything a worker process needs, built from one RuntimeConfig.
  The repository and runner live as long as any copy of this struct.
*/
struct Runtime {
  std::shared_ptr<db::Repository>    repository;
  std::shared_ptr<const util::Clock> clock;
  std::shared_ptr<queue::Runner>     runner;

  db::QueueColumn           column;
  queue::RunOptions         options;
  std::chrono::milliseconds idle_backoff{std::chrono::seconds(1)};
};

/*
  BuildRepository

  Opens the backend named by config.database (memory when none is set).

  NOTE:
  This is the only place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const rowqueue::runtime::config::DatabaseConfig& config);

/*
  BuildRuntime

  Composition root: repository, queue table bootstrap (queue.bootstrap_schema)
  and a Runner on the system clock. Throws util::ValidationError for bad
  queue settings and std::runtime_error for a backend not compiled in.
*/
Runtime BuildRuntime(const rowqueue::runtime::config::RuntimeConfig& config);

} // namespace rowqueue::factory
