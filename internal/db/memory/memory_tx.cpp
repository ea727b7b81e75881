#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace quotecast::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), tx_lock_(repo.tx_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (!tx_lock_.owns_lock()) {
    throw util::Conflict("memory transaction already finished");
  }
  if (dirty_) {
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  tx_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (tx_lock_.owns_lock()) tx_lock_.unlock();
}

} // namespace quotecast::db::memory
