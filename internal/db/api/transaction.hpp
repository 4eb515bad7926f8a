#pragma once

namespace uploader::db {

/*
  One ledger batch.

  A batch lands completely or not at all, so a worker never leaves half
  of its completion rows behind.

  - reads inside the batch see its own writes
  - other batches see the writes only after Commit()
  - a batch destroyed while still open is rolled back

  SQLite:   BEGIN IMMEDIATE ... COMMIT on the shared connection
  Postgres: pqxx::work on a pooled connection
  Memory:   private copy of the committed state, swapped in on Commit()
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // Throws when the backend refuses the commit; the batch stays uncommitted.
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // false once Commit() succeeded or Rollback() ran
  virtual bool IsOpen() const = 0;
};

}
