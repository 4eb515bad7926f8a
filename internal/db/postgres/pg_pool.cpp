#include "pg_pool.hpp"

#include <stdexcept>

namespace uploader::db::postgres {

PgPool::PgPool(PgPoolOptions options) : options_(std::move(options)) {
  if (options_.connection_uri.empty()) {
    throw std::invalid_argument("postgres connection uri is empty");
  }
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const std::size_t limit = options_.max_connections == 0 ? 1 : options_.max_connections;

  std::unique_lock lock(mutex_);
  const bool available = returned_.wait_for(lock, options_.acquire_timeout, [&] { return !idle_.empty() || open_ < limit; });
  if (!available) {
    throw std::runtime_error("no ledger connection available within " + std::to_string(options_.acquire_timeout.count()) + " ms");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // reserve the slot, connect without holding the lock
  ++open_;
  lock.unlock();

  try {
    return Lend(Connect());
  } catch (...) {
    {
      std::lock_guard guard(mutex_);
      --open_;
    }
    returned_.notify_one();
    throw;
  }
}

std::unique_ptr<pqxx::connection> PgPool::Connect() {
  return std::make_unique<pqxx::connection>(options_.connection_uri);
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->GiveBack(returned);
    } else {
      delete returned;
    }
  });
}

void PgPool::GiveBack(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard guard(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

} // namespace uploader::db::postgres
