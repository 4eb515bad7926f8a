#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace uploader::db::postgres {

struct PgPoolOptions {
  std::string               connection_uri;
  std::size_t               max_connections = 4;
  std::chrono::milliseconds acquire_timeout{10000};
};

/*
  Connections to the shared ledger database.

  Each ledger batch checks out one connection and returns it when the
  batch ends. Connections are opened lazily up to max_connections; one
  that dropped while checked out is discarded instead of going back to
  the idle list. Nothing here depends on the ledger schema, so the pool
  also serves the schema bootstrap.

  Acquire() gives up after acquire_timeout so a stuck ledger cannot stall
  the upload loop; the caller treats that like any other ledger failure.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(PgPoolOptions options);
  PgPool(std::string connection_uri, std::size_t max_connections)
      : PgPool(PgPoolOptions{std::move(connection_uri), max_connections}) {}

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::unique_ptr<pqxx::connection> Connect();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const PgPoolOptions options_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace uploader::db::postgres
