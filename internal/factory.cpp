#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if ROWQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ROWQUEUE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace rowqueue::factory {

using google::protobuf::util::TimeUtil;

namespace {

constexpr const char* kDefaultTable = "rows";
constexpr const char* kDefaultField = "status";

db::QueueColumn ResolveColumn(const rowqueue::runtime::config::QueueConfig& queue) {
  db::QueueColumn column{
      .table = queue.table().empty() ? kDefaultTable : queue.table(),
      .field = queue.field().empty() ? kDefaultField : queue.field(),
  };
  db::sql::CheckColumn(column);
  return column;
}

void BootstrapQueueTable(db::Repository& repository, const db::QueueColumn& column) {
  auto tx = repository.Begin();
  util::ThrowIfDbError(repository.EnsureQueueTable(*tx, column), "bootstrap " + column.table + "." + column.field);
  tx->Commit();

  ROWQUEUE_LOG_INFO("queue table ready", {observability::StringField("table", column.table),
                                          observability::StringField("field", column.field)});
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const rowqueue::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if ROWQUEUE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::ValidationError("database.sqlite.path is required");
    }

    db::sqlite::SqliteOptions options;
    if (sqlite.has_wal_mode()) {
      options.wal_mode = sqlite.wal_mode();
    }
    if (sqlite.has_busy_timeout()) {
      options.busy_timeout = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(sqlite.busy_timeout()));
    }

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), options);
    ROWQUEUE_LOG_INFO("opened sqlite store", {observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ROWQUEUE_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw util::ValidationError("database.postgres.connection_uri is required");
    }

    db::postgres::PgPoolOptions options;
    if (postgres.max_connections() != 0) {
      options.max_connections = postgres.max_connections();
    }
    if (postgres.has_acquire_timeout()) {
      options.acquire_timeout = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(postgres.acquire_timeout()));
    }

    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), options);
    ROWQUEUE_LOG_INFO("opened postgres pool", {observability::IntField("max_connections", static_cast<int64_t>(options.max_connections))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Runtime BuildRuntime(const rowqueue::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Queue settings (validated before any store is opened)
  // ------------------------------------------------------------------
  runtime.column       = ResolveColumn(config.queue());
  runtime.options      = config::ToRunOptions(config.queue());
  runtime.idle_backoff = config::IdleBackoff(config.queue());

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config.database());
  if (config.queue().bootstrap_schema()) {
    BootstrapQueueTable(*runtime.repository, runtime.column);
  }

  // ------------------------------------------------------------------
  // Runner
  // ------------------------------------------------------------------
  runtime.clock  = util::DefaultClock();
  runtime.runner = std::make_shared<queue::Runner>(runtime.repository, runtime.clock);

  return runtime;
}

} // namespace rowqueue::factory
