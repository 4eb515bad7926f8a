#pragma once

#include <memory>

#include "internal/db/api/ledger_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace uploader::db::sqlite {

/*
  Ledger tables in a local sqlite file.

  Completion rows are inserted with INSERT OR IGNORE on (task_id,
  remote_key), so re-recording a key after a crash is harmless. Every
  statement runs inside the batch's BEGIN IMMEDIATE.
*/
class SqliteRepository final : public db::LedgerRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  bool TableExists(Transaction&, const std::string& table) override;

  std::vector<std::string> ListCompletedKeys(Transaction&, const std::string& task_id) override;
  Result InsertCompletions(Transaction&, const std::vector<model::CompletionRecord>&) override;

  std::optional<model::TaskSummaryRecord> GetTaskSummary(Transaction&, const std::string& task_id) override;
  Result UpsertTaskSummary(Transaction&, const model::TaskSummaryRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
