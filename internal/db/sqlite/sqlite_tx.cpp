#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace uploader::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    UPLOADER_LOG_WARN("discarding open ledger batch failed",
                      {observability::StringField("ledger", db_->Path()), observability::StringField("error", e.what())});
  }
}

// A failed COMMIT leaves the batch open; the destructor rolls it back.
void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  open_ = false;
}

void SqliteTransaction::Rollback() {
  if (!open_) return;
  open_ = false;
  db_->Exec("ROLLBACK;");
}

} // namespace uploader::db::sqlite
