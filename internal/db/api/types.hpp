#pragma once

#include <cstddef>
#include <string>

#include "internal/status/status.hpp"

namespace rowqueue::db {

/*
  A queue is one integer column of one table. A table may carry several
  queue columns; each is an independent queue.
*/
struct QueueColumn {
  std::string table;
  std::string field;
};

using StatusRange = status::StatusRange;

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

} // namespace rowqueue::db
