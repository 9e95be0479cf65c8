#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::db::sqlite {

using rowqueue::db::ErrorCode;
using rowqueue::db::Result;
using sql::Dialect;

namespace {

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK; }
    int rc() const { return rc_; }
    sqlite3_stmt* get() const { return st_; }

    void BindI64(int idx, int64_t v) { sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v)); }
    void BindText(int idx, const std::string& s) { sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT); }

    int Step() { return rc_ = sqlite3_step(st_); }

    int64_t ColI64(int col) const { return static_cast<int64_t>(sqlite3_column_int64(st_, col)); }

private:
    sqlite3_stmt* st_ = nullptr;
    int rc_ = SQLITE_OK;
};

model::RowRecord ReadRow(const Statement& st) {
    return model::RowRecord{.id = st.ColI64(0), .status = st.ColI64(1)};
}

void ThrowIfFailed(sqlite3* db, int rc, const char* context) {
    if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return;
    const auto code = rc == SQLITE_BUSY || rc == SQLITE_LOCKED ? ErrorCode::Busy : ErrorCode::InternalError;
    throw util::StoreError(code, std::string(context) + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Schema / rows
// ------------------------------------------------------------------

Result SqliteRepository::EnsureQueueTable(Transaction& t, const QueueColumn& column) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    char* err = nullptr;
    if (sqlite3_exec(db, sql::CreateTable(Dialect::kSqlite, column).c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "create table failed";
        sqlite3_free(err);
        return Result::Err(ErrorCode::InternalError, msg);
    }

    Statement has(db, sql::HasColumn(Dialect::kSqlite));
    if (!has.ok()) return Translate(db, has.rc());
    has.BindText(1, column.table);
    has.BindText(2, column.field);
    if (has.Step() != SQLITE_ROW) return Translate(db, has.rc());

    if (has.ColI64(0) == 0) {
        if (sqlite3_exec(db, sql::AddColumn(Dialect::kSqlite, column).c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "add column failed";
            sqlite3_free(err);
            return Result::Err(ErrorCode::InternalError, msg);
        }
    }

    if (sqlite3_exec(db, sql::CreateIndex(column).c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "create index failed";
        sqlite3_free(err);
        return Result::Err(ErrorCode::InternalError, msg);
    }
    return Result::Ok();
}

Result SqliteRepository::InsertRow(Transaction& t, const QueueColumn& column, model::RowRecord& row) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    Statement st(db, sql::InsertRow(Dialect::kSqlite, column));
    if (!st.ok()) return Translate(db, st.rc());

    st.BindI64(1, row.status);

    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);

    row.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::RowRecord>
SqliteRepository::GetRow(Transaction& t, const QueueColumn& column, int64_t id) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    Statement st(db, sql::SelectRow(Dialect::kSqlite, column));
    ThrowIfFailed(db, st.rc(), "sqlite select row");

    st.BindI64(1, id);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    ThrowIfFailed(db, rc, "sqlite select row");
    return ReadRow(st);
}

// ------------------------------------------------------------------
// Queue column
// ------------------------------------------------------------------

Result SqliteRepository::UpdateStatus(Transaction& t, const QueueColumn& column, const model::RowRecord& row) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    Statement st(db, sql::UpdateStatus(Dialect::kSqlite, column));
    if (!st.ok()) return Translate(db, st.rc());

    st.BindI64(1, row.status);
    st.BindI64(2, row.id);

    int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "row " + std::to_string(row.id) + " not found");
    return Result::Ok();
}

std::optional<model::RowRecord>
SqliteRepository::LockFirstInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    // BEGIN IMMEDIATE already holds the database write lock, so the row read
    // here cannot be claimed by another connection until commit.
    Statement st(db, sql::SelectFirstInRange(Dialect::kSqlite, column));
    ThrowIfFailed(db, st.rc(), "sqlite select first");

    st.BindI64(1, range.min);
    st.BindI64(2, range.max);

    int rc = st.Step();
    if (rc == SQLITE_DONE) return std::nullopt;
    ThrowIfFailed(db, rc, "sqlite select first");
    return ReadRow(st);
}

uint64_t SqliteRepository::CountInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    Statement st(db, sql::CountInRange(Dialect::kSqlite, column));
    ThrowIfFailed(db, st.rc(), "sqlite count");

    st.BindI64(1, range.min);
    st.BindI64(2, range.max);

    int rc = st.Step();
    if (rc != SQLITE_ROW) {
        ThrowIfFailed(db, rc, "sqlite count");
        return 0;
    }
    return static_cast<uint64_t>(st.ColI64(0));
}

std::vector<model::RowRecord>
SqliteRepository::ListInRange(Transaction& t, const QueueColumn& column, const StatusRange& range, const Pagination& pagination) {
    sql::CheckColumn(column);
    auto* db = TX(t).Handle();

    Statement st(db, sql::ListInRange(Dialect::kSqlite, column));
    ThrowIfFailed(db, st.rc(), "sqlite list");

    st.BindI64(1, range.min);
    st.BindI64(2, range.max);
    st.BindI64(3, sql::PageValue(pagination.limit));
    st.BindI64(4, sql::PageValue(pagination.offset));

    std::vector<model::RowRecord> out;
    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    ThrowIfFailed(db, rc, "sqlite list");
    return out;
}

} // namespace rowqueue::db::sqlite
