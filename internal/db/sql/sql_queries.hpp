#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/db/api/types.hpp"

namespace rowqueue::db::sql {

/*
  Canonical SQL used by the relational backends.

  Parameter style:
    Postgres: $1 $2 $3
    SQLite:   ? ? ?

  Both use ordered binding, so each builder takes the dialect and emits the
  matching placeholders. Table and column names cannot be bound; they are
  validated as plain identifiers and double-quoted, which both engines accept.
*/

enum class Dialect {
  kSqlite,
  kPostgres,
};

// [A-Za-z_][A-Za-z0-9_]*, at most 63 characters (Postgres NAMEDATALEN - 1).
bool IsIdentifier(std::string_view name);

// Throws util::ValidationError when table or field is not an identifier.
void CheckColumn(const QueueColumn& column);

std::string QuoteIdentifier(std::string_view name);

// schema

std::string CreateTable(Dialect dialect, const QueueColumn& column);

// params: table name, column name
std::string HasColumn(Dialect dialect);

std::string AddColumn(Dialect dialect, const QueueColumn& column);

std::string CreateIndex(const QueueColumn& column);

// rows

// params: status (Postgres variant returns the new id)
std::string InsertRow(Dialect dialect, const QueueColumn& column);

// params: id
std::string SelectRow(Dialect dialect, const QueueColumn& column);

// params: status, id
std::string UpdateStatus(Dialect dialect, const QueueColumn& column);

// queue column

// params: min, max
std::string SelectFirstInRange(Dialect dialect, const QueueColumn& column);

// params: min, max
std::string CountInRange(Dialect dialect, const QueueColumn& column);

// params: min, max, limit, offset
std::string ListInRange(Dialect dialect, const QueueColumn& column);

// LIMIT/OFFSET bind value; sizes past INT64_MAX mean "no bound".
int64_t PageValue(std::size_t value);

} // namespace rowqueue::db::sql
