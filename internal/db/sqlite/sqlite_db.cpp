#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rowqueue::db::sqlite {

static ErrorCode CodeFor(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreError(CodeFor(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError(CodeFor(rc), "sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreError(CodeFor(rc), msg);
  }
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately; BEGIN IMMEDIATE relies on it
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())), db_, "busy_timeout");

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace rowqueue::db::sqlite
