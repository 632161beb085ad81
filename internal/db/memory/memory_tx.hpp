#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace walship::db::memory {

/*
  Works on a private copy of the repository state and swaps it in on
  Commit(). The writer lock is taken for the whole lifetime, so the copy
  can never be stale when it is published.

  Every transaction, reads included, copies the frames and pages of all
  databases, and transactions on different databases serialize on the one
  writer lock. Cost grows with total stored size; use the sqlite or
  postgres repository for anything beyond tests and small single-host runs.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> writer_;
  MemoryRepository::State      working_;
  bool                         committed_ = false;
};

} // namespace walship::db::memory
