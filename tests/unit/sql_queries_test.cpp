#include "internal/db/sql/sql_queries.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using rowqueue::db::QueueColumn;
using rowqueue::db::sql::Dialect;
namespace sql = rowqueue::db::sql;

const QueueColumn kColumn{.table = "tasks", .field = "status"};

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestIdentifierRules() {
  assert(sql::IsIdentifier("tasks"));
  assert(sql::IsIdentifier("_queue_2"));
  assert(sql::IsIdentifier(std::string(63, 'a')));

  assert(!sql::IsIdentifier(""));
  assert(!sql::IsIdentifier("2tasks"));
  assert(!sql::IsIdentifier("tasks\""));
  assert(!sql::IsIdentifier("tasks status"));
  assert(!sql::IsIdentifier("tasks;--"));
  assert(!sql::IsIdentifier(std::string(64, 'a')));
}

void TestCheckColumnThrows() {
  bool threw = false;
  try {
    sql::CheckColumn(QueueColumn{.table = "tasks", .field = "status; DROP TABLE tasks"});
  } catch (const rowqueue::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  sql::CheckColumn(kColumn);
}

void TestClaimQueryOrdersAndLocks() {
  const auto sqlite = sql::SelectFirstInRange(Dialect::kSqlite, kColumn);
  assert(Contains(sqlite, "FROM \"tasks\""));
  assert(Contains(sqlite, "\"status\">=? AND \"status\"<=?"));
  assert(Contains(sqlite, "ORDER BY \"status\",id LIMIT 1"));
  assert(!Contains(sqlite, "FOR UPDATE"));

  const auto postgres = sql::SelectFirstInRange(Dialect::kPostgres, kColumn);
  assert(Contains(postgres, "\"status\">=$1 AND \"status\"<=$2"));
  assert(Contains(postgres, "LIMIT 1 FOR UPDATE;"));
}

void TestSchemaStatements() {
  const auto create = sql::CreateTable(Dialect::kSqlite, kColumn);
  assert(Contains(create, "CREATE TABLE IF NOT EXISTS \"tasks\""));
  assert(Contains(create, "id INTEGER PRIMARY KEY"));
  assert(Contains(create, "\"status\" INTEGER NOT NULL DEFAULT 1000000000000000000"));

  const auto add = sql::AddColumn(Dialect::kPostgres, kColumn);
  assert(Contains(add, "ADD COLUMN \"status\" BIGINT NOT NULL DEFAULT 1000000000000000000"));

  assert(sql::CreateIndex(kColumn) == "CREATE INDEX IF NOT EXISTS \"tasks_status_idx\" ON \"tasks\" (\"status\");");
}

void TestRowStatements() {
  assert(sql::InsertRow(Dialect::kSqlite, kColumn) == "INSERT INTO \"tasks\" (\"status\") VALUES(?);");
  assert(sql::InsertRow(Dialect::kPostgres, kColumn) == "INSERT INTO \"tasks\" (\"status\") VALUES($1) RETURNING id;");
  assert(sql::UpdateStatus(Dialect::kPostgres, kColumn) == "UPDATE \"tasks\" SET \"status\"=$1 WHERE id=$2;");
  assert(Contains(sql::ListInRange(Dialect::kSqlite, kColumn), "LIMIT ? OFFSET ?;"));
}

void TestPageValueClamps() {
  assert(sql::PageValue(0) == 0);
  assert(sql::PageValue(100) == 100);
  assert(sql::PageValue(std::numeric_limits<std::size_t>::max()) == std::numeric_limits<int64_t>::max());
}

} // namespace

int main() {
  TestIdentifierRules();
  TestCheckColumnThrows();
  TestClaimQueryOrdersAndLocks();
  TestSchemaStatements();
  TestRowStatements();
  TestPageValueClamps();

  std::cout << "rowqueue_unit_sql_queries: pass\n";
  return 0;
}
