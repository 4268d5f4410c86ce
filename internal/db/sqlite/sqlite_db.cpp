#include "sqlite_db.hpp"

#include <stdexcept>
#include <utility>

namespace ctxsync::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite " + what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : SqliteDB(std::move(path), Options{}) {
}

SqliteDB::SqliteDB(std::string path, Options options) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "sqlite open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(options);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) {
    return;
  }
  std::string msg = "sqlite exec: ";
  msg += err ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw std::runtime_error(msg);
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  auto lock = WriterLock();
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) Exec(sql);
    Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqliteDB::Configure(const Options& options) {
  // extended codes separate primary key collisions from other constraint failures
  Check(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
  Check(sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout.count())), db_, "busy_timeout");

  if (options.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace ctxsync::db::sqlite
