#include "sql_queries.hpp"

#include <cctype>
#include <limits>

#include "internal/util/errors.hpp"

namespace rowqueue::db::sql {

namespace {

constexpr std::size_t kMaxIdentifierLength = 63;

std::string Placeholder(Dialect dialect, int index) {
  if (dialect == Dialect::kPostgres) {
    return "$" + std::to_string(index);
  }
  return "?";
}

// Column type of the status field; both are signed 64-bit.
const char* StatusType(Dialect dialect) {
  return dialect == Dialect::kPostgres ? "BIGINT" : "INTEGER";
}

std::string Table(const QueueColumn& column) {
  return QuoteIdentifier(column.table);
}

std::string Field(const QueueColumn& column) {
  return QuoteIdentifier(column.field);
}

std::string RangePredicate(Dialect dialect, const QueueColumn& column) {
  return Field(column) + ">=" + Placeholder(dialect, 1) + " AND " + Field(column) + "<=" + Placeholder(dialect, 2);
}

} // namespace

bool IsIdentifier(std::string_view name) {
  if (name.empty() || name.size() > kMaxIdentifierLength) {
    return false;
  }

  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') {
    return false;
  }

  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_') {
      return false;
    }
  }
  return true;
}

void CheckColumn(const QueueColumn& column) {
  if (!IsIdentifier(column.table)) {
    throw util::ValidationError("invalid table name '" + column.table + "'");
  }
  if (!IsIdentifier(column.field)) {
    throw util::ValidationError("invalid status field name '" + column.field + "'");
  }
}

std::string QuoteIdentifier(std::string_view name) {
  return "\"" + std::string(name) + "\"";
}

std::string CreateTable(Dialect dialect, const QueueColumn& column) {
  const char* id_type = dialect == Dialect::kPostgres ? "BIGINT GENERATED BY DEFAULT AS IDENTITY PRIMARY KEY" : "INTEGER PRIMARY KEY";

  return "CREATE TABLE IF NOT EXISTS " + Table(column) + " (id " + id_type + ", " + Field(column) + " " + StatusType(dialect) +
         " NOT NULL DEFAULT " + std::to_string(status::Status::Minimum(status::State::kCreated).value()) + ");";
}

std::string HasColumn(Dialect dialect) {
  if (dialect == Dialect::kPostgres) {
    return "SELECT COUNT(*) FROM information_schema.columns"
           " WHERE table_schema=current_schema() AND table_name=$1 AND column_name=$2;";
  }
  return "SELECT COUNT(*) FROM pragma_table_info(?) WHERE name=?;";
}

std::string AddColumn(Dialect dialect, const QueueColumn& column) {
  // Existing rows join the queue as CREATED: present but never claimed.
  return "ALTER TABLE " + Table(column) + " ADD COLUMN " + Field(column) + " " + StatusType(dialect) + " NOT NULL DEFAULT " +
         std::to_string(status::Status::Minimum(status::State::kCreated).value()) + ";";
}

std::string CreateIndex(const QueueColumn& column) {
  return "CREATE INDEX IF NOT EXISTS " + QuoteIdentifier(column.table + "_" + column.field + "_idx") + " ON " + Table(column) + " (" +
         Field(column) + ");";
}

std::string InsertRow(Dialect dialect, const QueueColumn& column) {
  auto sql = "INSERT INTO " + Table(column) + " (" + Field(column) + ") VALUES(" + Placeholder(dialect, 1) + ")";
  if (dialect == Dialect::kPostgres) {
    sql += " RETURNING id";
  }
  return sql + ";";
}

std::string SelectRow(Dialect dialect, const QueueColumn& column) {
  return "SELECT id," + Field(column) + " FROM " + Table(column) + " WHERE id=" + Placeholder(dialect, 1) + ";";
}

std::string UpdateStatus(Dialect dialect, const QueueColumn& column) {
  return "UPDATE " + Table(column) + " SET " + Field(column) + "=" + Placeholder(dialect, 1) + " WHERE id=" + Placeholder(dialect, 2) + ";";
}

std::string SelectFirstInRange(Dialect dialect, const QueueColumn& column) {
  auto sql = "SELECT id," + Field(column) + " FROM " + Table(column) + " WHERE " + RangePredicate(dialect, column) + " ORDER BY " +
             Field(column) + ",id LIMIT 1";

  // SQLite has no row locks; BEGIN IMMEDIATE already holds the write lock.
  if (dialect == Dialect::kPostgres) {
    sql += " FOR UPDATE";
  }
  return sql + ";";
}

std::string CountInRange(Dialect dialect, const QueueColumn& column) {
  return "SELECT COUNT(*) FROM " + Table(column) + " WHERE " + RangePredicate(dialect, column) + ";";
}

std::string ListInRange(Dialect dialect, const QueueColumn& column) {
  return "SELECT id," + Field(column) + " FROM " + Table(column) + " WHERE " + RangePredicate(dialect, column) + " ORDER BY " +
         Field(column) + ",id LIMIT " + Placeholder(dialect, 3) + " OFFSET " + Placeholder(dialect, 4) + ";";
}

int64_t PageValue(std::size_t value) {
  constexpr auto kMax = static_cast<std::size_t>(std::numeric_limits<int64_t>::max());
  return static_cast<int64_t>(value > kMax ? kMax : value);
}

} // namespace rowqueue::db::sql
