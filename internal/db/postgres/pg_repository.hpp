#pragma once

#include "internal/db/api/ledger_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace uploader::db::postgres {

/*
  Shared ledger for several upload stations.

  Statements are the PG_ ones from sql_queries.hpp. Errors are mapped
  from the pqxx exception hierarchy: broken connections become
  Unavailable, serialization failures SerializationFailure.
*/
class PgRepository final : public db::LedgerRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  bool TableExists(Transaction&, const std::string& table) override;

  std::vector<std::string> ListCompletedKeys(Transaction&, const std::string& task_id) override;
  Result InsertCompletions(Transaction&, const std::vector<model::CompletionRecord>&) override;

  std::optional<model::TaskSummaryRecord> GetTaskSummary(Transaction&, const std::string& task_id) override;
  Result UpsertTaskSummary(Transaction&, const model::TaskSummaryRecord&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
