#include "internal/db/sqlite/sqlite_repository.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/ledger/completion_index.hpp"
#include "internal/ledger/completion_recorder.hpp"
#include "tests/unit/support/test_fakes.hpp"

namespace {

using uploader::db::kCompletionTable;
using uploader::db::kSummaryTable;
using uploader::db::model::CompletionRecord;
using uploader::db::model::TaskSummaryRecord;
using uploader::db::sqlite::SqliteDB;
using uploader::db::sqlite::SqliteRepository;

std::shared_ptr<SqliteDB> OpenDb(const std::string& name, bool bootstrap) {
  auto db = std::make_shared<SqliteDB>((uploader::testing::MakeTempDir(name) / "ledger.db").string());
  if (bootstrap) {
    db->Exec(uploader::db::sql::CREATE_UPLOAD_FILES);
    db->Exec(uploader::db::sql::CREATE_UPLOADS);
  }
  return db;
}

CompletionRecord Row(const std::string& key, const std::string& status) {
  CompletionRecord record;
  record.task_id        = "t1";
  record.remote_key     = key;
  record.file_name      = key.substr(key.rfind('/') + 1);
  record.file_size      = 1234;
  record.file_type      = "image";
  record.status         = status;
  record.uploaded_at_ms = 1700000000000;
  return record;
}

void TestTablesAndCompletions() {
  SqliteRepository repo(OpenDb("sqlite_completions", true));

  {
    auto tx = repo.Begin();
    assert(repo.TableExists(*tx, kCompletionTable));
    assert(repo.TableExists(*tx, kSummaryTable));
    assert(!repo.TableExists(*tx, "orders"));

    std::vector<CompletionRecord> rows = {Row("P/IMAGE/b.jpg", "uploaded"), Row("P/IMAGE/a.jpg", "skipped")};
    assert(repo.InsertCompletions(*tx, rows));
    tx->Commit();
  }

  {
    // duplicates are ignored, not errors
    auto                          tx   = repo.Begin();
    std::vector<CompletionRecord> rows = {Row("P/IMAGE/a.jpg", "uploaded"), Row("P/IMAGE/c.jpg", "uploaded")};
    assert(repo.InsertCompletions(*tx, rows));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto keys = repo.ListCompletedKeys(*tx, "t1");
  assert(keys.size() == 3);
  assert(keys[0] == "P/IMAGE/a.jpg");
  assert(keys[2] == "P/IMAGE/c.jpg");
  assert(repo.ListCompletedKeys(*tx, "t2").empty());
  tx->Commit();
}

void TestUncommittedWritesRollBack() {
  SqliteRepository repo(OpenDb("sqlite_rollback", true));

  {
    auto                          tx   = repo.Begin();
    std::vector<CompletionRecord> rows = {Row("P/IMAGE/a.jpg", "uploaded")};
    assert(repo.InsertCompletions(*tx, rows));
    assert(repo.ListCompletedKeys(*tx, "t1").size() == 1);
  }

  auto tx = repo.Begin();
  assert(tx->IsOpen());
  assert(repo.ListCompletedKeys(*tx, "t1").empty());
  tx->Rollback();
  assert(!tx->IsOpen());

  // the write lock is released, a new batch can start
  auto next = repo.Begin();
  next->Commit();
  assert(!next->IsOpen());
}

void TestSummaryUpsert() {
  SqliteRepository repo(OpenDb("sqlite_summary", true));

  TaskSummaryRecord record;
  record.task_id        = "t1";
  record.uploaded_files = 3;
  record.failed_files   = 1;
  record.uploaded_bytes = 300;
  record.status         = "failed";
  record.updated_at_ms  = 1;

  {
    auto tx = repo.Begin();
    assert(!repo.GetTaskSummary(*tx, "t1").has_value());
    assert(repo.UpsertTaskSummary(*tx, record));
    record.uploaded_files = 5;
    record.failed_files   = 0;
    record.status         = "completed";
    assert(repo.UpsertTaskSummary(*tx, record));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto stored = repo.GetTaskSummary(*tx, "t1");
  assert(stored.has_value());
  assert(stored->uploaded_files == 5);
  assert(stored->failed_files == 0);
  assert(stored->uploaded_bytes == 300);
  assert(stored->status == "completed");
}

void TestMissingSchema() {
  auto repo = std::make_shared<SqliteRepository>(OpenDb("sqlite_no_schema", false));

  {
    auto                          tx   = repo->Begin();
    std::vector<CompletionRecord> rows = {Row("P/IMAGE/a.jpg", "uploaded")};
    assert(!repo->TableExists(*tx, kCompletionTable));
    assert(!repo->InsertCompletions(*tx, rows));
  }

  auto lookup = uploader::ledger::RemoteCompletionIndex(repo).Lookup("t1");
  assert(lookup.reachable);
  assert(lookup.keys.empty());
}

void TestRecorderOverSqlite() {
  auto repo = std::make_shared<SqliteRepository>(OpenDb("sqlite_recorder", true));

  uploader::model::ManifestEntry entry;
  entry.local_path = "/orders/1/RAW/x.cr2";
  entry.remote_key = "P/RAW/x.cr2";
  entry.size_bytes = 77;
  entry.category   = uploader::model::FileCategory::kRawImage;

  uploader::ledger::CompletionRecorder recorder(repo, "t1", 10);
  recorder.Record(entry, uploader::ledger::kStatusUploaded);

  uploader::ledger::SessionSummary summary;
  summary.uploaded_files = 1;
  summary.uploaded_bytes = 77;
  summary.status         = "completed";
  assert(recorder.Finalize(summary));

  auto lookup = uploader::ledger::RemoteCompletionIndex(repo).Lookup("t1");
  assert(lookup.keys.count("P/RAW/x.cr2") == 1);

  auto tx = repo->Begin();
  assert(repo->GetTaskSummary(*tx, "t1")->uploaded_bytes == 77);
}

} // namespace

int main() {
  TestTablesAndCompletions();
  TestUncommittedWritesRollBack();
  TestSummaryUpsert();
  TestMissingSchema();
  TestRecorderOverSqlite();

  std::cout << "order_uploader_unit_sqlite_repository: pass\n";
  return 0;
}
