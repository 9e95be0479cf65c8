#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "options.hpp"
#include "outcome.hpp"

namespace rowqueue::queue {

// A row the Runner claimed and resolved. error holds the job's failure, if
// any; the row is already stored when Process() returns.
struct Processed {
  db::model::RowRecord row;
  std::exception_ptr   error;
};

/*
  Runner

  One Run() call processes at most one row:

    Phase A (one transaction)
      - reclaim the oldest WORKING lease older than options.timeout
      - claim the oldest WAITING row whose priority is not in the future

    Phase B (no transaction held)
      - run the action
      - store the outcome in a new transaction

  The Runner holds no queue state between calls and takes no in-process
  locks; mutual exclusion comes entirely from the store's transactions.
  Safe to call from many threads as long as the repository is.
*/
class Runner {
 public:
  explicit Runner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const util::Clock> clock = util::DefaultClock());

  // Returns the processed row with its final status, or std::nullopt when no
  // row is eligible. If the action fails, the row is stored first and the
  // failure is then rethrown.
  std::optional<db::model::RowRecord> Run(const db::QueueColumn& column, const Action& action, const RunOptions& options = {});

  std::optional<db::model::RowRecord> Run(const std::string& rows, const std::string& field, const Action& action,
                                          const RunOptions& options = {});

  // Same cycle as Run(), but a failed job comes back in Processed::error
  // instead of being rethrown. Whatever Process() throws was raised by the
  // Runner itself or by the store.
  std::optional<Processed> Process(const db::QueueColumn& column, const Action& action, const RunOptions& options = {});

 private:
  struct Claim {
    db::model::RowRecord row;
    int                  attempts = 0; // attempts recorded when claimed
  };

  std::optional<Claim> ClaimNext(const db::QueueColumn& column, const RunOptions& options);

  db::model::RowRecord Resolve(const db::QueueColumn& column, const Claim& claim, const Outcome& outcome, const RunOptions& options);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace rowqueue::queue
