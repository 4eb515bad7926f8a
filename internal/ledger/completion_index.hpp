#pragma once

#include <string>
#include <unordered_set>

#include "internal/db/api/ledger_repository.hpp"

namespace uploader::ledger {

struct CompletionLookup {
  std::unordered_set<std::string> keys;

  // false when the ledger could not be queried; keys is then empty
  bool reachable = false;
};

/*
  Read side of the ledger: which remote keys of a task are already done.

  Fails open. An unreachable ledger or a missing table yields an empty
  set, never an exception, so a transfer can always proceed from the
  local checkpoint alone.
*/
class RemoteCompletionIndex {
 public:
  explicit RemoteCompletionIndex(db::LedgerRepositoryPtr repository);

  CompletionLookup Lookup(const std::string& task_id) const;

 private:
  db::LedgerRepositoryPtr repository_;
};

} // namespace uploader::ledger
