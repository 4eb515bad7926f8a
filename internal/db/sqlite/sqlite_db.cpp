#include "sqlite_db.hpp"

#include <stdexcept>

namespace uploader::db::sqlite {

namespace {

std::string Describe(int rc, const char* detail) {
  std::string out = sqlite3_errstr(rc);
  if (detail && *detail) {
    out += ": ";
    out += detail;
  }
  return out;
}

} // namespace

SqliteDB::SqliteDB(SqliteOptions options) : options_(std::move(options)) {
  if (options_.path.empty()) {
    throw std::invalid_argument("sqlite ledger path is empty");
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(options_.path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = Describe(rc, db_ ? sqlite3_errmsg(db_) : nullptr);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open ledger " + options_.path + ": " + msg);
  }

  sqlite3_busy_timeout(db_, options_.busy_timeout_ms > 0 ? options_.busy_timeout_ms : 0);

  try {
    // in-memory databases ignore WAL and stay in "memory" journal mode
    Exec("PRAGMA journal_mode=WAL;"
         "PRAGMA synchronous=NORMAL;"
         "PRAGMA foreign_keys=ON;");
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string msg = Describe(rc, err);
  sqlite3_free(err);
  throw std::runtime_error(msg);
}

} // namespace uploader::db::sqlite
