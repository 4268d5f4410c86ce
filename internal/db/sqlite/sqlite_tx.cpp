#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace ctxsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->WriterLock()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      CTXSYNC_LOG_WARN("sqlite rollback failed", {observability::ErrorField(e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_->Handle(), "COMMIT;", nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite commit failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw TransactionConflict("sqlite commit: " + msg);
    }
    throw std::runtime_error("sqlite commit: " + msg);
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace ctxsync::db::sqlite
