#include "tally.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace rowqueue::queue {

std::map<status::State, uint64_t> Tally(db::Repository& repository, const db::QueueColumn& column) {
  db::sql::CheckColumn(column);

  std::map<status::State, uint64_t> counts;

  auto tx = repository.Begin();
  for (const auto state : status::kAllStates) {
    counts[state] = repository.CountInRange(*tx, column, status::Status::Range(state));
  }
  tx->Commit();

  return counts;
}

std::map<status::State, uint64_t> Tally(db::Repository& repository, const std::string& rows, const std::string& field) {
  return Tally(repository, db::QueueColumn{.table = rows, .field = field});
}

} // namespace rowqueue::queue
