#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "rowqueue/v1.hpp"

using rowqueue::v1::Outcome;
using rowqueue::v1::RowRecord;
using rowqueue::v1::Status;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

// Demo job: every third row aborts once and comes back a second later, the rest succeed.
Outcome ProcessRow(RowRecord& row) {
  if (row.id % 3 == 0 && Status::FromInteger(row.status).attempts() == 0) {
    return rowqueue::v1::AbortWith{std::chrono::seconds(1)};
  }
  std::cout << "processed row " << row.id << '\n';
  return rowqueue::v1::Success{};
}

int main(int argc, char** argv) {
  // Without a config file the example runs against an in-memory queue.
  if (argc > 2) {
    std::cerr << "Usage: worker_example [config.yaml]" << std::endl;
    return 1;
  }

  try {
    rowqueue::runtime::config::RuntimeConfig config;
    if (argc == 2) {
      config = rowqueue::config::ConfigLoader::LoadFromYaml(argv[1]);
    } else {
      config.mutable_queue()->set_table("tasks");
      config.mutable_queue()->set_bootstrap_schema(true);
      config.mutable_queue()->mutable_idle_backoff()->set_nanos(200'000'000);
    }

    rowqueue::observability::InitializeLogging(config.logging());

    // ------------------------------------------------------------
    // Build runtime and seed a few rows
    // ------------------------------------------------------------
    auto runtime = rowqueue::factory::BuildRuntime(config);
    {
      auto tx = runtime.repository->Begin();
      for (int i = 0; i < 6; ++i) {
        RowRecord row{.status = Status::Waiting(runtime.clock->Now()).value()};
        rowqueue::util::ThrowIfDbError(runtime.repository->InsertRow(*tx, runtime.column, row), "seed row");
      }
      tx->Commit();
    }

    // ------------------------------------------------------------
    // Poll until interrupted or the queue is done
    // ------------------------------------------------------------
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    rowqueue::v1::Worker worker(runtime.runner, runtime.column, ProcessRow, runtime.options, runtime.idle_backoff);
    worker.Start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (g_running && std::chrono::steady_clock::now() < deadline) {
      const auto counts = rowqueue::v1::Tally(*runtime.repository, runtime.column);
      if (counts.at(rowqueue::v1::State::kWaiting) == 0 && counts.at(rowqueue::v1::State::kWorking) == 0) break;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.Stop();

    for (const auto& [state, count] : rowqueue::v1::Tally(*runtime.repository, runtime.column)) {
      std::cout << rowqueue::v1::ToString(state) << ": " << count << '\n';
    }
    rowqueue::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ROWQUEUE_LOG_ERROR("Fatal error", {rowqueue::observability::StringField("error", e.what())});
    rowqueue::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
