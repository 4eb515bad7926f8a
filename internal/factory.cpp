#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/object/object_arrow_store.hpp"
#if UPLOADER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if UPLOADER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace uploader::factory {

using observability::StringField;

namespace {

#if UPLOADER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->Exec(db::sql::CREATE_UPLOAD_FILES);
  sqlite_db->Exec(db::sql::CREATE_UPLOADS);
}
#endif

#if UPLOADER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec(db::sql::PG_CREATE_UPLOAD_FILES);
  tx.exec(db::sql::PG_CREATE_UPLOADS);
  tx.commit();
}
#endif

db::LedgerRepositoryPtr BuildLedger(const uploader::runtime::config::RuntimeConfig& config) {
  const auto& ledger = config.ledger();
  if (ledger.has_sqlite()) {
#if UPLOADER_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.path = ledger.sqlite().path();
    if (ledger.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(ledger.sqlite().busy_timeout_ms());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(std::move(options));
    if (ledger.sqlite().bootstrap_schema()) {
      BootstrapSqliteSchema(sqlite_db);
    }
    UPLOADER_LOG_INFO("ledger backend", {StringField("kind", "sqlite"), StringField("path", ledger.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite ledger requested but not enabled at build time");
#endif
  }

  if (ledger.has_postgres()) {
#if UPLOADER_DB_POSTGRES
    const auto& pg   = ledger.postgres();
    db::postgres::PgPoolOptions options;
    options.connection_uri = pg.connection_uri();
    if (pg.max_connections() > 0) {
      options.max_connections = pg.max_connections();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(std::move(options));
    if (pg.bootstrap_schema()) {
      BootstrapPostgresSchema(pool);
    }
    UPLOADER_LOG_INFO("ledger backend", {StringField("kind", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres ledger requested but not enabled at build time");
#endif
  }

  UPLOADER_LOG_WARN("no ledger configured, completions are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

storage::ObjectStorePtr BuildObjectStore(const uploader::runtime::config::RuntimeConfig& config) {
  auto [fs, root] = storage::common::Unwrap(storage::common::ResolveFileSystem(config.object_storage()), "object storage");
  UPLOADER_LOG_INFO("object store", {StringField("filesystem", fs->type_name()), StringField("root", root)});
  return std::make_shared<storage::ObjectArrowStore>(std::move(fs), std::move(root), config.transfer().chunk_size_bytes());
}

} // namespace

engine::WorkerOptions MakeWorkerOptions(const uploader::runtime::config::RuntimeConfig& config) {
  engine::WorkerOptions options;
  options.save_interval_entries               = config.checkpoint().save_interval_entries();
  options.pause_poll_interval_ms              = config.transfer().pause_poll_interval_ms();
  options.verify_remote_existence             = config.transfer().verify_remote_existence();
  options.completion_flush_threshold          = config.transfer().completion_flush_threshold();
  options.progress.step_percent               = config.progress().step_percent();
  options.progress.small_file_threshold_bytes = config.progress().small_file_threshold_bytes();
  return options;
}

/*
    Build the process-wide dependency graph
*/
Runtime BuildRuntime(const uploader::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  runtime.ledger         = BuildLedger(config);
  runtime.object_store   = BuildObjectStore(config);
  runtime.state_store    = std::make_shared<checkpoint::StateStore>(config.checkpoint().directory());
  runtime.worker_options = MakeWorkerOptions(config);

  return runtime;
}

std::unique_ptr<engine::TransferWorker> MakeWorker(const Runtime& runtime) {
  return std::make_unique<engine::TransferWorker>(runtime.object_store, runtime.ledger, runtime.state_store, runtime.worker_options);
}

} // namespace uploader::factory
