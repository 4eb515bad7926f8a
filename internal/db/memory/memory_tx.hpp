#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace uploader::db::memory {

/*
  Works on a private copy of the committed ledger state.

  Commit() swaps the copy in only when no other batch committed since the
  copy was taken; otherwise it throws and the caller retries the batch.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return open_;
  }

  MemoryRepository::State& Writable();
  const MemoryRepository::State& Snapshot() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  bool                    open_         = true;
};

} // namespace uploader::db::memory
