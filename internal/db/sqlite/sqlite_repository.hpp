#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace rowqueue::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureQueueTable(Transaction&, const QueueColumn&) override;
  Result InsertRow(Transaction&, const QueueColumn&, model::RowRecord&) override;
  std::optional<model::RowRecord> GetRow(Transaction&, const QueueColumn&, int64_t id) override;

  Result UpdateStatus(Transaction&, const QueueColumn&, const model::RowRecord&) override;
  std::optional<model::RowRecord> LockFirstInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  uint64_t CountInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  std::vector<model::RowRecord> ListInRange(Transaction&, const QueueColumn&, const StatusRange&, const Pagination&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
