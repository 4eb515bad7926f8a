#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace uploader::db::sqlite {

/*
  Ledger batch on the shared sqlite connection.

  BEGIN IMMEDIATE takes the write lock when the batch opens, so the
  inserts inside it never hit SQLITE_BUSY halfway through. Waiting for the
  lock is bounded by the connection's busy timeout.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return open_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      open_ = false;
};

} // namespace uploader::db::sqlite
