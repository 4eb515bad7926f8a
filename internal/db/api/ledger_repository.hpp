#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/completion_record.hpp"
#include "internal/db/model/task_summary_record.hpp"

namespace uploader::db {

inline constexpr const char* kCompletionTable = "upload_files";
inline constexpr const char* kSummaryTable    = "uploads";

/*
  Upload ledger.

  The ledger is the source of truth for "already uploaded". The local
  checkpoint only caches it.

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Begin() and reads throw when the backend is unreachable; callers that
    must fail open (RemoteCompletionIndex) catch and degrade
*/

class LedgerRepository {
 public:
  virtual ~LedgerRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual bool TableExists(Transaction&, const std::string& table) = 0;

  // True when recorded completions outlive the process.
  virtual bool IsDurable() const { return true; }

  // ---------------------------------------------------------------------
  // Per-file completion rows
  // ---------------------------------------------------------------------

  virtual std::vector<std::string> ListCompletedKeys(Transaction&, const std::string& task_id) = 0;

  // Rows whose (task_id, remote_key) already exist are left untouched.
  virtual Result InsertCompletions(Transaction&, const std::vector<model::CompletionRecord>&) = 0;

  // ---------------------------------------------------------------------
  // Task summary
  // ---------------------------------------------------------------------

  virtual std::optional<model::TaskSummaryRecord> GetTaskSummary(Transaction&, const std::string& task_id) = 0;

  virtual Result UpsertTaskSummary(Transaction&, const model::TaskSummaryRecord&) = 0;
};

using LedgerRepositoryPtr = std::shared_ptr<LedgerRepository>;

} // namespace uploader::db
