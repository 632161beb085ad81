#include "memory_tx.hpp"

#include <stdexcept>

namespace walship::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  std::lock_guard lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() = default;

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!writer_.owns_lock()) throw std::logic_error("memory transaction already finished");
  return working_;
}

void MemoryTransaction::Commit() {
  if (!writer_.owns_lock()) throw std::logic_error("memory transaction already finished");
  {
    std::lock_guard lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace walship::db::memory
