#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::db::postgres {

PgPool::PgPool(std::string conninfo, PgPoolOptions options) : conninfo_(std::move(conninfo)), options_(options) {
  if (options_.max_connections == 0) options_.max_connections = 1;
}

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : PgPool(std::move(conninfo), PgPoolOptions{.max_connections = max_connections}) {
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

bool PgPool::CanProceed() const {
  return !idle_.empty() || live_connections_ < options_.max_connections;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  const auto deadline = std::chrono::steady_clock::now() + options_.acquire_timeout;
  for (;;) {
    while (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      if (conn->is_open()) return Checkout(std::move(conn));

      // server went away; drop it and open a fresh one below
      --live_connections_;
      ROWQUEUE_LOG_WARN("dropping closed postgres connection");
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();
      return Checkout(Open());
    }

    if (options_.acquire_timeout.count() == 0) {
      cv_.wait(lock, [this] { return CanProceed(); });
    } else if (!cv_.wait_until(lock, deadline, [this] { return CanProceed(); })) {
      throw util::StoreError(ErrorCode::Busy, "postgres pool exhausted: " + std::to_string(options_.max_connections) + " connections in use");
    }
  }
}

// Called with live_connections_ already reserved.
std::unique_ptr<pqxx::connection> PgPool::Open() {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    ROWQUEUE_LOG_DEBUG("opened postgres connection", {observability::IntField("live", static_cast<int64_t>(LiveConnections()))});
    return conn;
  } catch (const pqxx::broken_connection& e) {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::StoreError(ErrorCode::IOError, std::string("postgres connect: ") + e.what());
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Checkout(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace rowqueue::db::postgres
