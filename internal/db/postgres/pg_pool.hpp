#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace rowqueue::db::postgres {

struct PgPoolOptions {
  std::size_t max_connections = 16;

  // How long Acquire() waits for a free connection; zero waits forever.
  std::chrono::milliseconds acquire_timeout{0};
};

/*
  PgPool

  Connection pool used by PgRepository. Every queue transaction (claim,
  resolve, tally) checks out one connection for its whole lifetime, so the
  pool size bounds how many callers can be inside Phase A at once.

  - libpqxx connections are NOT thread-safe -> never shared.
  - Acquire() blocks while all max_connections are checked out and throws
    util::StoreError(Busy) once acquire_timeout passes.
  - Connections found closed on checkout are dropped and replaced.

  Must be owned by a shared_ptr: checked-out connections hold a weak
  reference back to the pool.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, PgPoolOptions options = {});
  PgPool(std::string conninfo, std::size_t max_connections);

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  std::shared_ptr<pqxx::connection> Checkout(std::unique_ptr<pqxx::connection> conn);
  std::unique_ptr<pqxx::connection> Open();
  void                              Release(pqxx::connection* conn);
  bool                              CanProceed() const;

  std::string   conninfo_;
  PgPoolOptions options_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace rowqueue::db::postgres
