#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ctxsync::db::sqlite {

/*
  Owns the sqlite3 handle behind SqliteRepository.

  Every transaction runs on this one handle, so SqliteTransaction holds
  WriterLock() from BEGIN IMMEDIATE until COMMIT/ROLLBACK. Foreign keys are
  always on: context_version rows cascade with their context.
*/
class SqliteDB {
 public:
  struct Options {
    bool                      wal_mode = true;
    std::chrono::milliseconds busy_timeout{5000};
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements; throws std::runtime_error with the sqlite message.
  void Exec(const std::string& sql);

  // Applies idempotent DDL in a single transaction.
  void ApplySchema(const std::vector<std::string>& statements);

  std::unique_lock<std::mutex> WriterLock() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  void Configure(const Options& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace ctxsync::db::sqlite
