#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace uploader::db::sqlite {

struct SqliteOptions {
  std::string path;

  // Other uploaders on the same machine may hold the write lock.
  int busy_timeout_ms = 5000;
};

/*
  Owns the ledger's sqlite3 connection.

  The file is opened in WAL mode so readers of the ledger (reporting
  tools, a second uploader reading its completed keys) are not blocked
  while a batch is being committed.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  explicit SqliteDB(std::string path) : SqliteDB(SqliteOptions{std::move(path)}) {}
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  // Runs one or more statements without bound parameters.
  // Throws std::runtime_error carrying the sqlite error code and message.
  void Exec(const std::string& sql);

 private:
  SqliteOptions options_;
  sqlite3*      db_ = nullptr;
};

} // namespace uploader::db::sqlite
