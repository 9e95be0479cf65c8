#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <variant>

#include "internal/db/model/row_record.hpp"

namespace rowqueue::queue {

/*
  What a job reports back to the Runner.

    Success    -> FINISHED
    RetryWith  -> WAITING again, attempt not counted
    AbortWith  -> WAITING again with the attempt counted, CANCELED once the
                  retry budget is spent
    Cancel     -> CANCELED now
    Fault      -> like AbortWith (default delay); the error is rethrown to the
                  caller after the row is stored

  A job that throws is treated as Fault{std::current_exception()}.
*/

struct Success {};

struct RetryWith {
  // Overrides RunOptions::delay when set.
  std::optional<std::chrono::milliseconds> delay;
};

struct AbortWith {
  std::optional<std::chrono::milliseconds> delay;
};

struct Cancel {};

struct Fault {
  std::exception_ptr error;
};

using Outcome = std::variant<Success, RetryWith, AbortWith, Cancel, Fault>;

// The job. It may touch the application's own columns but never the status
// column; the Runner owns that one.
using Action = std::function<Outcome(db::model::RowRecord&)>;

} // namespace rowqueue::queue
