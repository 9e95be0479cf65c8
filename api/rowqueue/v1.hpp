#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/outcome.hpp"
#include "internal/queue/options.hpp"
#include "internal/queue/runner.hpp"
#include "internal/queue/tally.hpp"
#include "internal/queue/worker.hpp"
#include "internal/status/status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if ROWQUEUE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if ROWQUEUE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace rowqueue::v1 {
using namespace ::rowqueue::status;
using namespace ::rowqueue::queue;

using ::rowqueue::db::QueueColumn;
using ::rowqueue::db::Repository;
using ::rowqueue::db::model::RowRecord;
using ::rowqueue::util::Interrupted;
using ::rowqueue::util::NotFound;
using ::rowqueue::util::StoreError;
using ::rowqueue::util::ValidationError;
} // namespace rowqueue::v1
