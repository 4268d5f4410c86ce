#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace ctxsync::db::sqlite {

using ctxsync::db::ErrorCode;
using ctxsync::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::ContextRecord ReadContext(sqlite3_stmt* st) {
  model::ContextRecord r;
  r.id              = ColText(st, 0);
  r.current_version = ColU64(st, 1);
  r.payload_json    = ColText(st, 2);
  r.source_system   = ColI32(st, 3);
  r.parent_id       = ColText(st, 4);
  r.updated_at_ms   = ColU64(st, 5);
  return r;
}

model::ContextVersionRecord ReadVersion(sqlite3_stmt* st) {
  model::ContextVersionRecord r;
  r.context_id    = ColText(st, 0);
  r.version       = ColU64(st, 1);
  r.payload_json  = ColText(st, 2);
  r.source_system = ColI32(st, 3);
  r.created_at_ms = ColU64(st, 4);
  r.metadata_json = ColText(st, 5);
  return r;
}

// True on a row, false once the statement is done; any other code is an
// error and must not read as an empty or shorter result.
bool StepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;

  const std::string msg = std::string("sqlite ") + what + ": " + sqlite3_errmsg(db);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw TransactionConflict(msg);
  throw std::runtime_error(msg);
}

uint64_t ScalarU64(sqlite3* db, const char* sql, const std::string* bound_text = nullptr) {
  auto st = Prepare(db, sql);
  if (bound_text) BindText(st.get(), 1, *bound_text);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite scalar query: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Contexts
// ------------------------------------------------------------------

Result SqliteRepository::InsertContext(Transaction& t, const model::ContextRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_CONTEXT);

  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.current_version);
  BindText(st.get(), 3, r.payload_json);
  BindI32(st.get(), 4, r.source_system);
  BindText(st.get(), 5, r.parent_id);
  BindU64(st.get(), 6, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ContextRecord> SqliteRepository::GetContext(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_CONTEXT);
  BindText(st.get(), 1, id);

  if (!StepRow(db, st.get(), "get context")) return std::nullopt;
  return ReadContext(st.get());
}

Result SqliteRepository::UpdateContext(Transaction& t, const model::ContextRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_CONTEXT_CAS);

  BindU64(st.get(), 1, r.current_version);
  BindText(st.get(), 2, r.payload_json);
  BindI32(st.get(), 3, r.source_system);
  BindText(st.get(), 4, r.parent_id);
  BindU64(st.get(), 5, r.updated_at_ms);
  BindText(st.get(), 6, r.id);
  BindU64(st.get(), 7, expected_version);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 1) return Result::Ok();

  // Distinguish a missing row from a stale expected version.
  st.reset();
  if (!GetContext(t, r.id)) return Result::Err(ErrorCode::NotFound, "context not found: " + r.id);
  return Result::Err(ErrorCode::Conflict, "context '" + r.id + "' moved past version " + std::to_string(expected_version));
}

Result SqliteRepository::DeleteContext(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_CONTEXT);
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::ListContextIds(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_CONTEXT_IDS);

  std::vector<std::string> ids;
  while (StepRow(db, st.get(), "list context ids")) {
    ids.push_back(ColText(st.get(), 0));
  }
  return ids;
}

uint64_t SqliteRepository::CountContexts(Transaction& t) {
  return ScalarU64(TX(t).Handle(), sql::COUNT_CONTEXTS);
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result SqliteRepository::InsertVersion(Transaction& t, const model::ContextVersionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_VERSION);

  BindText(st.get(), 1, r.context_id);
  BindU64(st.get(), 2, r.version);
  BindText(st.get(), 3, r.payload_json);
  BindI32(st.get(), 4, r.source_system);
  BindU64(st.get(), 5, r.created_at_ms);
  BindText(st.get(), 6, r.metadata_json);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ContextVersionRecord> SqliteRepository::GetVersion(Transaction& t, const std::string& context_id, uint64_t version) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_VERSION);
  BindText(st.get(), 1, context_id);
  BindU64(st.get(), 2, version);

  if (!StepRow(db, st.get(), "get version")) return std::nullopt;
  return ReadVersion(st.get());
}

std::vector<model::ContextVersionRecord> SqliteRepository::ListVersions(Transaction& t, const std::string& context_id,
                                                                        std::optional<uint64_t> before_version, uint64_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_VERSIONS_PAGE);
  BindText(st.get(), 1, context_id);
  BindU64(st.get(), 2, before_version.value_or(static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max())));
  BindU64(st.get(), 3, std::min<uint64_t>(limit, static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max())));

  std::vector<model::ContextVersionRecord> out;
  while (StepRow(db, st.get(), "list versions")) {
    out.push_back(ReadVersion(st.get()));
  }
  return out;
}

uint64_t SqliteRepository::CountVersions(Transaction& t, const std::string& context_id) {
  return ScalarU64(TX(t).Handle(), sql::COUNT_VERSIONS, &context_id);
}

uint64_t SqliteRepository::CountAllVersions(Transaction& t) {
  return ScalarU64(TX(t).Handle(), sql::COUNT_ALL_VERSIONS);
}

Result SqliteRepository::DeleteVersionsAbove(Transaction& t, const std::string& context_id, uint64_t max_version) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_VERSIONS_ABOVE);
  BindText(st.get(), 1, context_id);
  BindU64(st.get(), 2, max_version);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::TrimVersionsToMaxCount(Transaction& t, const std::string& context_id, uint64_t max_versions, uint64_t* removed) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::TRIM_VERSIONS);
  BindText(st.get(), 1, context_id);
  BindText(st.get(), 2, context_id);
  BindU64(st.get(), 3, max_versions);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && removed) *removed = static_cast<uint64_t>(sqlite3_changes(db));
  return result;
}

// ------------------------------------------------------------------
// Durable cache entries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_CACHE_ENTRY);
  BindText(st.get(), 1, r.cache_key);
  BindText(st.get(), 2, r.value);
  BindU64(st.get(), 3, r.expires_at_ms);
  BindU64(st.get(), 4, r.updated_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_CACHE_ENTRY);
  BindText(st.get(), 1, key);

  if (!StepRow(db, st.get(), "get cache entry")) return std::nullopt;

  model::CacheEntryRecord r;
  r.cache_key     = ColText(st.get(), 0);
  r.value         = ColText(st.get(), 1);
  r.expires_at_ms = ColU64(st.get(), 2);
  r.updated_at_ms = ColU64(st.get(), 3);
  return r;
}

Result SqliteRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_CACHE_ENTRY);
  BindText(st.get(), 1, key);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_EXPIRED_CACHE_ENTRIES);
  BindU64(st.get(), 1, now_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && removed) *removed = static_cast<uint64_t>(sqlite3_changes(db));
  return result;
}

uint64_t SqliteRepository::CountCacheEntries(Transaction& t) {
  return ScalarU64(TX(t).Handle(), sql::COUNT_CACHE_ENTRIES);
}

} // namespace ctxsync::db::sqlite
