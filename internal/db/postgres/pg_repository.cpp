#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace uploader::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::undefined_table*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

bool PgRepository::TableExists(Transaction& t, const std::string& table) {
  auto res = TX(t).Work().exec_params(sql::PG_TABLE_EXISTS, table);
  return !res.empty() && res[0][0].as<int64_t>() > 0;
}

std::vector<std::string> PgRepository::ListCompletedKeys(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(sql::PG_SELECT_COMPLETED_KEYS, task_id);

  std::vector<std::string> keys;
  keys.reserve(res.size());
  for (const auto& row : res) {
    keys.emplace_back(row[0].c_str());
  }
  return keys;
}

Result PgRepository::InsertCompletions(Transaction& t, const std::vector<model::CompletionRecord>& records) {
  try {
    auto& work = TX(t).Work();
    for (const auto& r : records) {
      work.exec_params(sql::PG_INSERT_COMPLETION, r.task_id, r.remote_key, r.file_name, static_cast<int64_t>(r.file_size), r.file_type,
                       r.status, static_cast<int64_t>(r.uploaded_at_ms));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskSummaryRecord> PgRepository::GetTaskSummary(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(sql::PG_SELECT_SUMMARY, task_id);
  if (res.empty()) return std::nullopt;

  model::TaskSummaryRecord r;
  r.task_id        = res[0][0].c_str();
  r.uploaded_files = res[0][1].as<uint64_t>();
  r.skipped_files  = res[0][2].as<uint64_t>();
  r.failed_files   = res[0][3].as<uint64_t>();
  r.uploaded_bytes = res[0][4].as<uint64_t>();
  r.status         = res[0][5].c_str();
  r.updated_at_ms  = res[0][6].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertTaskSummary(Transaction& t, const model::TaskSummaryRecord& r) {
  try {
    TX(t).Work().exec_params(sql::PG_UPSERT_SUMMARY, r.task_id, static_cast<int64_t>(r.uploaded_files),
                             static_cast<int64_t>(r.skipped_files), static_cast<int64_t>(r.failed_files),
                             static_cast<int64_t>(r.uploaded_bytes), r.status, static_cast<int64_t>(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace uploader::db::postgres
