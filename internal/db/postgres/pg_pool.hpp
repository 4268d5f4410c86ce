#pragma once

#include <pqxx/pqxx>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ctxsync::db::postgres {

/*
  Bounded libpqxx connection pool behind PgRepository.

  A pqxx::connection is used by one transaction at a time. Acquire() hands
  out a shared_ptr whose deleter returns the connection to the idle list;
  connections that were closed underneath us are dropped instead. New
  connections get every statement of sql::PostgresStatements() prepared.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16,
                  std::chrono::milliseconds acquire_timeout = std::chrono::seconds(30));

  // Throws std::runtime_error when no connection frees up within acquire_timeout.
  std::shared_ptr<pqxx::connection> Acquire();

  // Applies idempotent DDL in one transaction.
  void ApplySchema(const std::vector<std::string>& statements);

  std::size_t LiveConnections() const;

 private:
  std::unique_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_ = 0;
};

} // namespace ctxsync::db::postgres
