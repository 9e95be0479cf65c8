#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/row_record.hpp"

namespace rowqueue::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - LockFirstInRange returns the row with the numerically smallest status in
    the inclusive range and holds it exclusively until the transaction ends
  - UpdateStatus overwrites exactly one row's status column

  The DB is the source of truth for queue state; callers keep nothing in
  memory between transactions.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Schema / row lifecycle (application side)
  // ---------------------------------------------------------------------

  // Creates the table and the indexed status column when missing.
  virtual Result EnsureQueueTable(Transaction&, const QueueColumn&) = 0;

  // Inserts a row with the given status; assigns row.id.
  virtual Result InsertRow(Transaction&, const QueueColumn&, model::RowRecord& row) = 0;

  virtual std::optional<model::RowRecord> GetRow(Transaction&, const QueueColumn&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Queue column
  // ---------------------------------------------------------------------

  virtual Result UpdateStatus(Transaction&, const QueueColumn&, const model::RowRecord& row) = 0;

  virtual std::optional<model::RowRecord> LockFirstInRange(Transaction&, const QueueColumn&, const StatusRange& range) = 0;

  virtual uint64_t CountInRange(Transaction&, const QueueColumn&, const StatusRange& range) = 0;

  virtual std::vector<model::RowRecord> ListInRange(Transaction&, const QueueColumn&, const StatusRange& range,
                                                    const Pagination& pagination) = 0;
};

} // namespace rowqueue::db
