#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ctxsync::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared handle while holding SqliteDB::WriterLock().
  Readers and writers alike take the lock, so a context CAS never races
  another transaction on the same database.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace ctxsync::db::sqlite
