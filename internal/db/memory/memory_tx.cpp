#include "memory_tx.hpp"

#include <stdexcept>

namespace rowqueue::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::logic_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  committed_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace rowqueue::db::memory
