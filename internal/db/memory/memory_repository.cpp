#include "memory_repository.hpp"

#include <algorithm>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "memory_tx.hpp"

namespace rowqueue::db::memory {

namespace {

bool HasColumn(const std::vector<std::string>& columns, const std::string& field) {
  return std::find(columns.begin(), columns.end(), field) != columns.end();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// A missing table or column is an error, just like it is for the SQL engines.
MemoryRepository::Table& MemoryRepository::RequireTable(State& state, const QueueColumn& column) {
  sql::CheckColumn(column);
  auto it = state.tables.find(column.table);
  if (it == state.tables.end()) {
    throw util::StoreError(ErrorCode::NotFound, "no such table: " + column.table);
  }
  if (!HasColumn(it->second.columns, column.field)) {
    throw util::StoreError(ErrorCode::NotFound, "no such column: " + column.table + "." + column.field);
  }
  return it->second;
}

Result MemoryRepository::EnsureQueueTable(Transaction& t, const QueueColumn& column) {
  sql::CheckColumn(column);

  auto& table = TX(t).Mutable().tables[column.table];
  if (HasColumn(table.columns, column.field)) return Result::Ok();

  table.columns.push_back(column.field);
  const auto initial = status::Status::Minimum(status::State::kCreated).value();
  for (auto& [_, values] : table.rows) {
    values.emplace(column.field, initial);
  }
  return Result::Ok();
}

Result MemoryRepository::InsertRow(Transaction& t, const QueueColumn& column, model::RowRecord& row) {
  sql::CheckColumn(column);
  auto& tables = TX(t).Mutable().tables;
  auto  it     = tables.find(column.table);
  if (it == tables.end() || !HasColumn(it->second.columns, column.field)) {
    return Result::Err(ErrorCode::NotFound, "no such column: " + column.table + "." + column.field);
  }

  auto& table = it->second;
  if (row.id == 0) {
    row.id = table.next_id;
  } else if (table.rows.contains(row.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "row " + std::to_string(row.id) + " exists");
  }
  table.next_id = std::max(table.next_id, row.id + 1);

  auto& values = table.rows[row.id];
  const auto initial = status::Status::Minimum(status::State::kCreated).value();
  for (const auto& name : table.columns) {
    values[name] = initial;
  }
  values[column.field] = row.status;
  return Result::Ok();
}

std::optional<model::RowRecord> MemoryRepository::GetRow(Transaction& t, const QueueColumn& column, int64_t id) {
  auto& table = RequireTable(TX(t).Mutable(), column);
  auto  it    = table.rows.find(id);
  if (it == table.rows.end()) return std::nullopt;
  return model::RowRecord{.id = id, .status = it->second.at(column.field)};
}

Result MemoryRepository::UpdateStatus(Transaction& t, const QueueColumn& column, const model::RowRecord& row) {
  sql::CheckColumn(column);
  auto& tables = TX(t).Mutable().tables;
  auto  it     = tables.find(column.table);
  if (it == tables.end() || !HasColumn(it->second.columns, column.field)) {
    return Result::Err(ErrorCode::NotFound, "no such column: " + column.table + "." + column.field);
  }

  auto row_it = it->second.rows.find(row.id);
  if (row_it == it->second.rows.end()) return Result::Err(ErrorCode::NotFound, "row " + std::to_string(row.id) + " not found");
  row_it->second[column.field] = row.status;
  return Result::Ok();
}

std::optional<model::RowRecord> MemoryRepository::LockFirstInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
  auto& table = RequireTable(TX(t).Mutable(), column);

  std::optional<model::RowRecord> first;
  for (const auto& [id, values] : table.rows) {
    const auto value = values.at(column.field);
    if (!range.Contains(value)) continue;
    // rows iterate in id order, so strict less keeps the lowest id on ties
    if (!first || value < first->status) {
      first = model::RowRecord{.id = id, .status = value};
    }
  }
  return first;
}

uint64_t MemoryRepository::CountInRange(Transaction& t, const QueueColumn& column, const StatusRange& range) {
  const auto& table = RequireTable(TX(t).Mutable(), column);
  return static_cast<uint64_t>(std::count_if(table.rows.begin(), table.rows.end(),
                                             [&](const auto& entry) { return range.Contains(entry.second.at(column.field)); }));
}

std::vector<model::RowRecord> MemoryRepository::ListInRange(Transaction& t, const QueueColumn& column, const StatusRange& range,
                                                            const Pagination& pagination) {
  const auto& table = RequireTable(TX(t).Mutable(), column);

  std::vector<model::RowRecord> matches;
  for (const auto& [id, values] : table.rows) {
    const auto value = values.at(column.field);
    if (range.Contains(value)) matches.push_back({.id = id, .status = value});
  }

  std::stable_sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) { return a.status < b.status; });

  if (pagination.offset >= matches.size()) return {};
  const auto begin = matches.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  const auto left  = matches.size() - pagination.offset;
  const auto end   = begin + static_cast<std::ptrdiff_t>(pagination.limit >= left ? left : pagination.limit);
  return {begin, end};
}

} // namespace rowqueue::db::memory
