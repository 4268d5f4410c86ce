#include "pg_repository.hpp"

#include <cstdint>
#include <limits>

namespace ctxsync::db::postgres {

namespace {

// BIGINT columns; u64 values above INT64_MAX never occur for versions.
int64_t Big(uint64_t v) {
  return v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ? std::numeric_limits<int64_t>::max() : static_cast<int64_t>(v);
}

model::ContextRecord ReadContext(const pqxx::row& row) {
  model::ContextRecord r;
  r.id              = row[0].c_str();
  r.current_version = row[1].as<uint64_t>();
  r.payload_json    = row[2].c_str();
  r.source_system   = row[3].as<int>();
  r.parent_id       = row[4].is_null() ? "" : row[4].c_str();
  r.updated_at_ms   = row[5].as<uint64_t>();
  return r;
}

model::ContextVersionRecord ReadVersion(const pqxx::row& row) {
  model::ContextVersionRecord r;
  r.context_id    = row[0].c_str();
  r.version       = row[1].as<uint64_t>();
  r.payload_json  = row[2].c_str();
  r.source_system = row[3].as<int>();
  r.created_at_ms = row[4].as<uint64_t>();
  r.metadata_json = row[5].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e) || dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Contexts
// ------------------------------------------------------------------

Result PgRepository::InsertContext(Transaction& t, const model::ContextRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_context", r.id, Big(r.current_version), r.payload_json, r.source_system, r.parent_id, Big(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ContextRecord> PgRepository::GetContext(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_context", id);
  if (res.empty()) return std::nullopt;
  return ReadContext(res[0]);
}

Result PgRepository::UpdateContext(Transaction& t, const model::ContextRecord& r, uint64_t expected_version) {
  try {
    auto res = TX(t).Work().exec_prepared("update_context_cas", r.id, Big(r.current_version), r.payload_json, r.source_system, r.parent_id,
                                          Big(r.updated_at_ms), Big(expected_version));
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetContext(t, r.id)) return Result::Err(ErrorCode::NotFound, "context not found: " + r.id);
  return Result::Err(ErrorCode::Conflict, "context '" + r.id + "' moved past version " + std::to_string(expected_version));
}

Result PgRepository::DeleteContext(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_context", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListContextIds(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_context_ids");

  std::vector<std::string> ids;
  ids.reserve(res.size());
  for (const auto& row : res) {
    ids.emplace_back(row[0].c_str());
  }
  return ids;
}

uint64_t PgRepository::CountContexts(Transaction& t) {
  return TX(t).Work().exec_prepared("count_contexts")[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result PgRepository::InsertVersion(Transaction& t, const model::ContextVersionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_version", r.context_id, Big(r.version), r.payload_json, r.source_system, Big(r.created_at_ms), r.metadata_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ContextVersionRecord> PgRepository::GetVersion(Transaction& t, const std::string& context_id, uint64_t version) {
  auto res = TX(t).Work().exec_prepared("get_version", context_id, Big(version));
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::vector<model::ContextVersionRecord> PgRepository::ListVersions(Transaction& t, const std::string& context_id, std::optional<uint64_t> before_version,
                                                                    uint64_t limit) {
  auto res = TX(t).Work().exec_prepared("list_versions", context_id, Big(before_version.value_or(std::numeric_limits<uint64_t>::max())), Big(limit));

  std::vector<model::ContextVersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

uint64_t PgRepository::CountVersions(Transaction& t, const std::string& context_id) {
  return TX(t).Work().exec_prepared("count_versions", context_id)[0][0].as<uint64_t>();
}

uint64_t PgRepository::CountAllVersions(Transaction& t) {
  return TX(t).Work().exec_prepared("count_all_versions")[0][0].as<uint64_t>();
}

Result PgRepository::DeleteVersionsAbove(Transaction& t, const std::string& context_id, uint64_t max_version) {
  try {
    TX(t).Work().exec_prepared("delete_versions_above", context_id, Big(max_version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TrimVersionsToMaxCount(Transaction& t, const std::string& context_id, uint64_t max_versions, uint64_t* removed) {
  try {
    auto res = TX(t).Work().exec_prepared("trim_versions", context_id, Big(max_versions));
    if (removed) *removed = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Durable cache entries
// ------------------------------------------------------------------

Result PgRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_cache_entry", r.cache_key, r.value, Big(r.expires_at_ms), Big(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheEntryRecord> PgRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_prepared("get_cache_entry", key);
  if (res.empty()) return std::nullopt;

  model::CacheEntryRecord r;
  r.cache_key     = res[0][0].c_str();
  r.value         = res[0][1].c_str();
  r.expires_at_ms = res[0][2].as<uint64_t>();
  r.updated_at_ms = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  try {
    TX(t).Work().exec_prepared("delete_cache_entry", key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_expired_cache_entries", Big(now_ms));
    if (removed) *removed = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountCacheEntries(Transaction& t) {
  return TX(t).Work().exec_prepared("count_cache_entries")[0][0].as<uint64_t>();
}

} // namespace ctxsync::db::postgres
