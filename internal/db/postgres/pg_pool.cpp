#include "pg_pool.hpp"

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace ctxsync::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections), acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool ready = cv_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || live_ < max_connections_; });
  if (!ready) {
    throw std::runtime_error("postgres pool: no connection available after " + std::to_string(acquire_timeout_.count()) + "ms");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  ++live_;
  lock.unlock();
  try {
    return Lend(Open());
  } catch (const std::exception&) {
    {
      std::lock_guard relock(mutex_);
      --live_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::ApplySchema(const std::vector<std::string>& statements) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : statements) {
    tx.exec(sql);
  }
  tx.commit();
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

std::unique_ptr<pqxx::connection> PgPool::Open() {
  auto conn = std::make_unique<pqxx::connection>(conninfo_);
  for (const auto& statement : sql::PostgresStatements()) {
    conn->prepare(statement.name, statement.sql);
  }
  return conn;
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* returned) {
    if (auto self = pool.lock()) {
      self->Return(returned);
      return;
    }
    delete returned;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_;
    }
  }
  cv_.notify_one();
}

} // namespace ctxsync::db::postgres
