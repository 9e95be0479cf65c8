#pragma once

#include <cstdint>

namespace rowqueue::db::model {

/*
  Queue view of an application row.

  IMPORTANT:
  - Only the identity and the one governed status column are visible here.
  - All other columns belong to the application and are never read or
    written by the queue.
*/

struct RowRecord {
  int64_t id = 0;

  // Encoded queue status (see status::Status)
  int64_t status = 0;
};

}
