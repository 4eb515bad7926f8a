#include "memory_tx.hpp"

#include <stdexcept>

namespace uploader::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Writable() {
  if (!open_) throw std::logic_error("ledger batch already finished");
  return working_;
}

void MemoryTransaction::Commit() {
  if (!open_) throw std::logic_error("ledger batch already finished");

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw std::runtime_error("ledger batch conflicts with a concurrent commit");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  open_ = false;
}

// Nothing to undo: the copy is simply dropped.
void MemoryTransaction::Rollback() {
  open_ = false;
}

} // namespace uploader::db::memory
