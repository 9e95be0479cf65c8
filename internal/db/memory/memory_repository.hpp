#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace rowqueue::db::memory {

class MemoryTransaction;

/*
  In-process store.

  Transactions are serialized: Begin() takes the repository mutex and holds it
  until Commit()/Rollback(), so every row read inside a transaction is
  exclusively locked. Do not open a second transaction on the same thread
  while one is live.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result EnsureQueueTable(Transaction&, const QueueColumn&) override;
  Result InsertRow(Transaction&, const QueueColumn&, model::RowRecord&) override;
  std::optional<model::RowRecord> GetRow(Transaction&, const QueueColumn&, int64_t id) override;

  Result UpdateStatus(Transaction&, const QueueColumn&, const model::RowRecord&) override;
  std::optional<model::RowRecord> LockFirstInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  uint64_t CountInRange(Transaction&, const QueueColumn&, const StatusRange&) override;
  std::vector<model::RowRecord> ListInRange(Transaction&, const QueueColumn&, const StatusRange&, const Pagination&) override;

private:
  friend class MemoryTransaction;

  struct Table {
    // id -> (column -> value)
    std::map<int64_t, std::unordered_map<std::string, int64_t>> rows;
    std::vector<std::string> columns;
    int64_t next_id = 1;
  };

  struct State {
    std::unordered_map<std::string, Table> tables;
  };

  static Table& RequireTable(State& state, const QueueColumn& column);

  std::mutex mutex_;
  State committed_;
};

}
