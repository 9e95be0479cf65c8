#pragma once

namespace rowqueue::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Rows returned by Repository::LockFirstInRange stay locked against
    other transactions until Commit()/Rollback()

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work + SELECT ... FOR UPDATE
  Memory: exclusive lock + snapshot copy
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once commit or rollback has been performed
  virtual bool IsCommitted() const = 0;
};

}
