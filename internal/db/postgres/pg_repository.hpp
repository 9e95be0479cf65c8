#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace rowqueue::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureQueueTable(Transaction&, const QueueColumn&) override;
  Result InsertRow(Transaction&, const QueueColumn&, model::RowRecord&) override;
  std::optional<model::RowRecord> GetRow(Transaction&, const QueueColumn&, int64_t id) override;

  Result UpdateStatus(Transaction&, const QueueColumn&, const model::RowRecord&) override;
  std::optional<model::RowRecord> LockFirstInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  uint64_t CountInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  std::vector<model::RowRecord> ListInRange(Transaction&, const QueueColumn&, const StatusRange&, const Pagination&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);

  template <typename Fn>
  static auto Guard(const char* context, Fn&& fn) -> decltype(fn());
};

}
