#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace rowqueue::db::postgres {

using sql::Dialect;

namespace {

model::RowRecord ReadRow(const pqxx::row& row) {
  return model::RowRecord{.id = row[0].as<int64_t>(), .status = row[1].as<int64_t>()};
}

} // namespace

// Read paths have no Result to carry a driver error, so they throw it as a
// StoreError instead.
template <typename Fn>
auto PgRepository::Guard(const char* context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    const auto result = Translate(e);
    throw util::StoreError(result.code, std::string(context) + ": " + result.message);
  }
}

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::EnsureQueueTable(Transaction& t, const QueueColumn& column) {
  sql::CheckColumn(column);
  try {
    auto& work = TX(t).Work();
    work.exec(sql::CreateTable(Dialect::kPostgres, column));

    auto has = work.exec_params(sql::HasColumn(Dialect::kPostgres), column.table, column.field);
    if (has[0][0].as<int64_t>() == 0) {
      work.exec(sql::AddColumn(Dialect::kPostgres, column));
    }

    work.exec(sql::CreateIndex(column));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertRow(Transaction& t, const QueueColumn& column, model::RowRecord& r) {
  sql::CheckColumn(column);
  try {
    auto res = TX(t).Work().exec_params(sql::InsertRow(Dialect::kPostgres, column), r.status);
    r.id     = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RowRecord> PgRepository::GetRow(Transaction& t, const QueueColumn& column, int64_t id) {
  sql::CheckColumn(column);
  auto res = Guard("postgres select row", [&] { return TX(t).Work().exec_params(sql::SelectRow(Dialect::kPostgres, column), id); });
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

Result PgRepository::UpdateStatus(Transaction& t, const QueueColumn& column, const model::RowRecord& r) {
  sql::CheckColumn(column);
  try {
    auto res = TX(t).Work().exec_params(sql::UpdateStatus(Dialect::kPostgres, column), r.status, r.id);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "row " + std::to_string(r.id) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RowRecord> PgRepository::LockFirstInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
  sql::CheckColumn(column);
  // FOR UPDATE: a concurrent claimant blocks here until we commit, then
  // re-checks the predicate against the row's new status.
  auto res = Guard("postgres select first",
                   [&] { return TX(t).Work().exec_params(sql::SelectFirstInRange(Dialect::kPostgres, column), range.min, range.max); });
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

uint64_t PgRepository::CountInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
  sql::CheckColumn(column);
  auto res = Guard("postgres count", [&] { return TX(t).Work().exec_params(sql::CountInRange(Dialect::kPostgres, column), range.min, range.max); });
  return res[0][0].as<uint64_t>();
}

std::vector<model::RowRecord> PgRepository::ListInRange(Transaction& t, const QueueColumn& column, const StatusRange& range,
                                                        const Pagination& pagination) {
  sql::CheckColumn(column);
  auto res = Guard("postgres list", [&] {
    return TX(t).Work().exec_params(sql::ListInRange(Dialect::kPostgres, column), range.min, range.max,
                                    sql::PageValue(pagination.limit), sql::PageValue(pagination.offset));
  });

  std::vector<model::RowRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

} // namespace rowqueue::db::postgres
