#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace uploader::db::sqlite {

using uploader::db::ErrorCode;
using uploader::db::Result;

namespace {

/*
  Owns a prepared statement for the duration of one call.
*/
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }
  explicit operator bool() const { return st_ != nullptr; }

  // throws on prepare failure; used by read paths that report errors by exception
  sqlite3_stmt* require(const char* what) const {
    if (!st_) throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db_));
    return st_;
  }

private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

bool SqliteRepository::TableExists(Transaction& t, const std::string& table) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::TABLE_EXISTS);
  BindText(st.require("sqlite table lookup"), 1, table);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite table lookup: ") + sqlite3_errmsg(db));
  return ColU64(st.get(), 0) > 0;
}

// ------------------------------------------------------------------
// Completions
// ------------------------------------------------------------------

std::vector<std::string> SqliteRepository::ListCompletedKeys(Transaction& t, const std::string& task_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_COMPLETED_KEYS);
  BindText(st.require("sqlite list completions"), 1, task_id);

  std::vector<std::string> keys;
  int                      rc = SQLITE_OK;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    keys.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite list completions: ") + sqlite3_errmsg(db));
  return keys;
}

Result SqliteRepository::InsertCompletions(Transaction& t, const std::vector<model::CompletionRecord>& records) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_COMPLETION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& r : records) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindText(st.get(), 1, r.task_id);
    BindText(st.get(), 2, r.remote_key);
    BindText(st.get(), 3, r.file_name);
    BindU64(st.get(), 4, r.file_size);
    BindText(st.get(), 5, r.file_type);
    BindText(st.get(), 6, r.status);
    BindU64(st.get(), 7, r.uploaded_at_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Summary
// ------------------------------------------------------------------

std::optional<model::TaskSummaryRecord> SqliteRepository::GetTaskSummary(Transaction& t, const std::string& task_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::SELECT_SUMMARY);
  BindText(st.require("sqlite get summary"), 1, task_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite get summary: ") + sqlite3_errmsg(db));

  model::TaskSummaryRecord r;
  r.task_id        = ColText(st.get(), 0);
  r.uploaded_files = ColU64(st.get(), 1);
  r.skipped_files  = ColU64(st.get(), 2);
  r.failed_files   = ColU64(st.get(), 3);
  r.uploaded_bytes = ColU64(st.get(), 4);
  r.status         = ColText(st.get(), 5);
  r.updated_at_ms  = ColU64(st.get(), 6);
  return r;
}

Result SqliteRepository::UpsertTaskSummary(Transaction& t, const model::TaskSummaryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_SUMMARY);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.task_id);
  BindU64(st.get(), 2, r.uploaded_files);
  BindU64(st.get(), 3, r.skipped_files);
  BindU64(st.get(), 4, r.failed_files);
  BindU64(st.get(), 5, r.uploaded_bytes);
  BindText(st.get(), 6, r.status);
  BindU64(st.get(), 7, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

} // namespace uploader::db::sqlite
