#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace ctxsync::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      CTXSYNC_LOG_WARN("postgres rollback failed", {observability::ErrorField(e.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& e) {
    // serialization failures and deadlocks: the version store retries these
    finished_ = true;
    throw TransactionConflict(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  tx_->abort();
}

} // namespace ctxsync::db::postgres
