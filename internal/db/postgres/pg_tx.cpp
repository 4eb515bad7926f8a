#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace uploader::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_, "ledger_batch");
}

PgTransaction::~PgTransaction() {
  if (!work_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    UPLOADER_LOG_WARN("discarding open ledger batch failed", {observability::StringField("error", e.what())});
  }
}

pqxx::work& PgTransaction::Work() {
  if (!work_) throw std::logic_error("ledger batch already finished");
  return *work_;
}

void PgTransaction::Close(bool commit) {
  auto& work = Work();
  if (commit) {
    work.commit();
  } else {
    work.abort();
  }
  work_.reset();
}

// On failure the work stays set and is aborted by the destructor.
void PgTransaction::Commit() {
  Close(true);
}

void PgTransaction::Rollback() {
  if (!work_) return;
  Close(false);
}

} // namespace uploader::db::postgres
