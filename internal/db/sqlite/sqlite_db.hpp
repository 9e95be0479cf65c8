#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace rowqueue::db::sqlite {

struct SqliteOptions {
  bool                      wal_mode     = true;
  std::chrono::milliseconds busy_timeout = std::chrono::seconds(5);
};

/*
  Thin RAII wrapper around sqlite3*.

  One SqliteDB is one connection. Threads that share it are serialized on
  TransactionMutex(); workers that should poll in parallel open their own
  SqliteDB on the same file and wait on busy_timeout instead.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace rowqueue::db::sqlite
