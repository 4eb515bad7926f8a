#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/ledger_repository.hpp"

namespace uploader::db::memory {

class MemoryTransaction;

/*
  Process-local ledger.

  Used when no ledger database is configured and by tests. A repository
  constructed with tables_present=false behaves like a database on which
  the schema was never created until CreateTables() is called.
*/
class MemoryRepository final : public db::LedgerRepository {
public:
  explicit MemoryRepository(bool tables_present = true);

  void CreateTables();

  std::unique_ptr<Transaction> Begin() override;

  bool TableExists(Transaction&, const std::string& table) override;
  bool IsDurable() const override { return false; }

  std::vector<std::string> ListCompletedKeys(Transaction&, const std::string& task_id) override;
  Result InsertCompletions(Transaction&, const std::vector<model::CompletionRecord>&) override;

  std::optional<model::TaskSummaryRecord> GetTaskSummary(Transaction&, const std::string& task_id) override;
  Result UpsertTaskSummary(Transaction&, const model::TaskSummaryRecord&) override;

private:
  friend class MemoryTransaction;

  struct State {
    bool tables_present = true;

    // task_id -> remote_key -> row
    std::unordered_map<std::string, std::map<std::string, model::CompletionRecord>> completions;
    std::unordered_map<std::string, model::TaskSummaryRecord> summaries;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
