#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/ledger_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/ledger/completion_index.hpp"
#include "internal/ledger/completion_recorder.hpp"

#if UPLOADER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if UPLOADER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using uploader::db::LedgerRepository;
using uploader::db::memory::MemoryRepository;
using uploader::db::model::CompletionRecord;
using uploader::db::model::TaskSummaryRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                             name;
  std::function<std::shared_ptr<LedgerRepository>()>      make_repository;
  std::function<bool()>                                   supports_restart;
  std::function<void(std::shared_ptr<LedgerRepository>&)> restart;
  std::function<void()>                                   cleanup;
  bool                                                    supports_parallel_transactions = true;
};

CompletionRecord Completion(const std::string& task_id, const std::string& key, const std::string& status = "uploaded") {
  return CompletionRecord{.task_id        = task_id,
                          .remote_key     = key,
                          .file_name      = key.substr(key.rfind('/') + 1),
                          .file_size      = 4096,
                          .file_type      = "image",
                          .status         = status,
                          .uploaded_at_ms = NowMs()};
}

void VerifySchemaPresent(LedgerRepository& repo) {
  auto tx = repo.Begin();
  assert(repo.TableExists(*tx, uploader::db::kCompletionTable));
  assert(repo.TableExists(*tx, uploader::db::kSummaryTable));
  assert(!repo.TableExists(*tx, "orders"));
  tx->Commit();
}

void VerifyCompletionsInsertAndList(LedgerRepository& repo, const std::string& task_id) {
  {
    auto                          tx   = repo.Begin();
    std::vector<CompletionRecord> rows = {Completion(task_id, "P/IMAGE/b.jpg"), Completion(task_id, "P/RAW/a.cr2")};
    assert(repo.InsertCompletions(*tx, rows));
    tx->Commit();
  }

  {
    // re-inserting a key keeps the first row
    auto                          tx   = repo.Begin();
    std::vector<CompletionRecord> rows = {Completion(task_id, "P/IMAGE/b.jpg", "skipped"), Completion(task_id, "P/VIDEO/c.mp4")};
    assert(repo.InsertCompletions(*tx, rows));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto keys = repo.ListCompletedKeys(*tx, task_id);
  assert(keys.size() == 3);
  assert(keys[0] == "P/IMAGE/b.jpg");
  assert(keys[1] == "P/RAW/a.cr2");
  assert(keys[2] == "P/VIDEO/c.mp4");
  assert(repo.ListCompletedKeys(*tx, task_id + "-other").empty());
  tx->Commit();
}

void VerifySummaryUpsert(LedgerRepository& repo, const std::string& task_id) {
  auto tx = repo.Begin();
  assert(!repo.GetTaskSummary(*tx, task_id).has_value());

  TaskSummaryRecord summary{.task_id        = task_id,
                            .uploaded_files = 4,
                            .skipped_files  = 1,
                            .failed_files   = 2,
                            .uploaded_bytes = 4000,
                            .status         = "failed",
                            .updated_at_ms  = NowMs()};
  assert(repo.UpsertTaskSummary(*tx, summary));

  summary.failed_files = 0;
  summary.status       = "completed";
  assert(repo.UpsertTaskSummary(*tx, summary));

  auto read = repo.GetTaskSummary(*tx, task_id);
  assert(read.has_value());
  assert(read->uploaded_files == 4);
  assert(read->failed_files == 0);
  assert(read->status == "completed");
  tx->Commit();
}

void VerifyRollbackBehavior(LedgerRepository& repo, const std::string& task_id) {
  {
    auto                          tx   = repo.Begin();
    std::vector<CompletionRecord> rows = {Completion(task_id, "P/IMAGE/rolled-back.jpg")};
    assert(repo.InsertCompletions(*tx, rows));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(repo.ListCompletedKeys(*check_tx, task_id).empty());
  check_tx->Commit();
}

void VerifyRecorderRoundTrip(const std::shared_ptr<LedgerRepository>& repo, const std::string& task_id) {
  uploader::ledger::CompletionRecorder recorder(repo, task_id, 2);

  for (int i = 0; i < 5; ++i) {
    uploader::model::ManifestEntry entry;
    entry.local_path = "/orders/" + task_id + "/IMAGE/" + std::to_string(i) + ".jpg";
    entry.remote_key = task_id + "/IMAGE/" + std::to_string(i) + ".jpg";
    entry.size_bytes = 10;
    recorder.Record(entry, uploader::ledger::kStatusUploaded);
    assert(recorder.FlushIfFull());
  }
  assert(recorder.Pending() == 1);

  uploader::ledger::SessionSummary session;
  session.uploaded_files = 5;
  session.uploaded_bytes = 50;
  session.status         = "completed";
  assert(recorder.Finalize(session));
  assert(recorder.Finalize(session));

  auto lookup = uploader::ledger::RemoteCompletionIndex(repo).Lookup(task_id);
  assert(lookup.reachable);
  assert(lookup.keys.size() == 5);

  auto tx = repo->Begin();
  auto summary = repo->GetTaskSummary(*tx, task_id);
  assert(summary->uploaded_files == 10);
  assert(summary->uploaded_bytes == 100);
  tx->Commit();
}

void VerifyConcurrentRecorders(const std::shared_ptr<LedgerRepository>& repo, const std::string& task_prefix, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  constexpr int kWorkers = 4;
  constexpr int kRecords = 25;

  std::vector<std::thread> threads;
  for (int w = 0; w < kWorkers; ++w) {
    threads.emplace_back([&, w]() {
      const auto                           task_id = task_prefix + "-" + std::to_string(w);
      uploader::ledger::CompletionRecorder recorder(repo, task_id, 1);
      for (int i = 0; i < kRecords; ++i) {
        uploader::model::ManifestEntry entry;
        entry.local_path = "/orders/x/IMAGE/" + std::to_string(i) + ".jpg";
        entry.remote_key = task_id + "/IMAGE/" + std::to_string(i) + ".jpg";
        recorder.Record(entry, uploader::ledger::kStatusUploaded);

        // a conflicting commit leaves the record buffered; try again
        while (!recorder.Flush()) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto tx = repo->Begin();
  for (int w = 0; w < kWorkers; ++w) {
    assert(repo->ListCompletedKeys(*tx, task_prefix + "-" + std::to_string(w)).size() == kRecords);
  }
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& task_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto                          tx   = repo->Begin();
    std::vector<CompletionRecord> rows = {Completion(task_id, "P/IMAGE/durable.jpg")};
    assert(repo->InsertCompletions(*tx, rows));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto keys = repo->ListCompletedKeys(*tx, task_id);
  assert(keys.size() == 1);
  assert(keys[0] == "P/IMAGE/durable.jpg");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<LedgerRepository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if UPLOADER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("order_uploader_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<uploader::db::sqlite::SqliteDB>(db_path);
    db->Exec(uploader::db::sql::CREATE_UPLOAD_FILES);
    db->Exec(uploader::db::sql::CREATE_UPLOADS);
    return std::make_shared<uploader::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<LedgerRepository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if UPLOADER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("UPLOADER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("UPLOADER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    uploader::db::postgres::PgPoolOptions options;
    options.connection_uri = conninfo;
    auto pool              = std::make_shared<uploader::db::postgres::PgPool>(std::move(options));
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      tx.exec(uploader::db::sql::PG_CREATE_UPLOAD_FILES);
      tx.exec(uploader::db::sql::PG_CREATE_UPLOADS);
      tx.commit();
    }
    return std::make_shared<uploader::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<LedgerRepository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared postgres database can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifySchemaPresent(*repo);
  VerifyCompletionsInsertAndList(*repo, run + "-completions");
  VerifySummaryUpsert(*repo, run + "-summary");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyRecorderRoundTrip(repo, run + "-recorder");
  VerifyConcurrentRecorders(repo, run + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if UPLOADER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if UPLOADER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "order_uploader_integration_ledger_parity: pass\n";
  return 0;
}
