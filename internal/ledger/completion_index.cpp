#include "internal/ledger/completion_index.hpp"

#include "internal/observability/logging.hpp"

namespace uploader::ledger {

using observability::IntField;
using observability::StringField;

RemoteCompletionIndex::RemoteCompletionIndex(db::LedgerRepositoryPtr repository) : repository_(std::move(repository)) {
}

CompletionLookup RemoteCompletionIndex::Lookup(const std::string& task_id) const {
  CompletionLookup lookup;
  if (!repository_) {
    return lookup;
  }

  try {
    auto tx = repository_->Begin();

    if (!repository_->TableExists(*tx, db::kCompletionTable)) {
      UPLOADER_LOG_WARN("ledger table missing, nothing is known as completed", {StringField("task_id", task_id)});
      lookup.reachable = true;
      return lookup;
    }

    for (auto& key : repository_->ListCompletedKeys(*tx, task_id)) {
      lookup.keys.insert(std::move(key));
    }
    tx->Commit();
    lookup.reachable = true;
  } catch (const std::exception& e) {
    UPLOADER_LOG_WARN("ledger unreachable, continuing from local checkpoint",
                      {StringField("task_id", task_id), StringField("error", e.what())});
    lookup.keys.clear();
    return lookup;
  }

  UPLOADER_LOG_INFO("ledger lookup", {StringField("task_id", task_id), IntField("completed", static_cast<int64_t>(lookup.keys.size()))});
  return lookup;
}

} // namespace uploader::ledger
