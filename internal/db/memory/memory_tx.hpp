#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace quotecast::db::memory {

/*
  Transaction = snapshot + write set

  Holds the repository's tx mutex from construction until Commit/Rollback,
  the in-memory counterpart of SQLite's BEGIN IMMEDIATE: no two
  transactions ever work on the same snapshot.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> tx_lock_;
  MemoryRepository::State      working_;
  bool                         dirty_       = false;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace quotecast::db::memory
