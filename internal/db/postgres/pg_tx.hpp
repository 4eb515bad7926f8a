#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace uploader::db::postgres {

/*
  Ledger batch on a pooled connection.

  The connection goes back to the pool when the batch is destroyed, so a
  batch should not outlive the flush that opened it.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work();

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return work_ != nullptr;
  }

 private:
  void Close(bool commit);

  // released after work_, which refers to it
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace uploader::db::postgres
