#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace ctxsync::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Contexts
// ------------------------------------------------------------------

Result MemoryRepository::InsertContext(Transaction& t, const model::ContextRecord& r) {
  if (TX(t).View().contexts.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "context exists: " + r.id);
  TX(t).MutableContext(r.id).contexts[r.id] = r;
  return Result::Ok();
}

std::optional<model::ContextRecord> MemoryRepository::GetContext(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  const auto  it = s.contexts.find(id);
  if (it == s.contexts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateContext(Transaction& t, const model::ContextRecord& r, uint64_t expected_version) {
  // Marking before the check keeps the read in the conflict set.
  auto& s  = TX(t).MutableContext(r.id);
  auto  it = s.contexts.find(r.id);
  if (it == s.contexts.end()) return Result::Err(ErrorCode::NotFound, "context not found: " + r.id);
  if (it->second.current_version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "context '" + r.id + "' is at version " + std::to_string(it->second.current_version));
  }
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteContext(Transaction& t, const std::string& id) {
  auto& s = TX(t).MutableContext(id);
  s.contexts.erase(id);
  s.versions.erase(id);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListContextIds(Transaction& t) {
  std::vector<std::string> ids;
  ids.reserve(TX(t).View().contexts.size());
  for (const auto& [id, _] : TX(t).View().contexts) {
    ids.push_back(id);
  }
  return ids;
}

uint64_t MemoryRepository::CountContexts(Transaction& t) {
  return TX(t).View().contexts.size();
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result MemoryRepository::InsertVersion(Transaction& t, const model::ContextVersionRecord& r) {
  if (!TX(t).View().contexts.contains(r.context_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "version references unknown context: " + r.context_id);
  }
  auto& history = TX(t).MutableContext(r.context_id).versions[r.context_id];
  if (history.contains(r.version)) {
    return Result::Err(ErrorCode::AlreadyExists, "version exists: " + r.context_id + "@" + std::to_string(r.version));
  }
  history[r.version] = r;
  return Result::Ok();
}

std::optional<model::ContextVersionRecord> MemoryRepository::GetVersion(Transaction& t, const std::string& context_id, uint64_t version) {
  const auto& s  = TX(t).View();
  const auto  it = s.versions.find(context_id);
  if (it == s.versions.end()) return std::nullopt;
  const auto v = it->second.find(version);
  if (v == it->second.end()) return std::nullopt;
  return v->second;
}

std::vector<model::ContextVersionRecord> MemoryRepository::ListVersions(Transaction& t, const std::string& context_id,
                                                                        std::optional<uint64_t> before_version, uint64_t limit) {
  std::vector<model::ContextVersionRecord> out;
  const auto&                              s  = TX(t).View();
  const auto                               it = s.versions.find(context_id);
  if (it == s.versions.end()) return out;

  auto end = before_version ? it->second.lower_bound(*before_version) : it->second.end();
  for (auto rit = std::make_reverse_iterator(end); rit != it->second.rend() && out.size() < limit; ++rit) {
    out.push_back(rit->second);
  }
  return out;
}

uint64_t MemoryRepository::CountVersions(Transaction& t, const std::string& context_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.versions.find(context_id);
  return it == s.versions.end() ? 0 : it->second.size();
}

uint64_t MemoryRepository::CountAllVersions(Transaction& t) {
  uint64_t total = 0;
  for (const auto& [_, history] : TX(t).View().versions) {
    total += history.size();
  }
  return total;
}

Result MemoryRepository::DeleteVersionsAbove(Transaction& t, const std::string& context_id, uint64_t max_version) {
  auto& s  = TX(t).MutableContext(context_id);
  auto  it = s.versions.find(context_id);
  if (it == s.versions.end()) return Result::Ok();
  it->second.erase(it->second.upper_bound(max_version), it->second.end());
  return Result::Ok();
}

Result MemoryRepository::TrimVersionsToMaxCount(Transaction& t, const std::string& context_id, uint64_t max_versions, uint64_t* removed) {
  uint64_t count = 0;
  auto&    s     = TX(t).MutableContext(context_id);
  auto     it    = s.versions.find(context_id);
  if (it != s.versions.end()) {
    while (it->second.size() > max_versions) {
      it->second.erase(it->second.begin());
      ++count;
    }
  }
  if (removed) *removed = count;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Durable cache entries
// ------------------------------------------------------------------

Result MemoryRepository::UpsertCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  TX(t).MutableCacheEntry(r.cache_key).cache_entries[r.cache_key] = r;
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  const auto  it = s.cache_entries.find(key);
  if (it == s.cache_entries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteCacheEntry(Transaction& t, const std::string& key) {
  TX(t).MutableCacheEntry(key).cache_entries.erase(key);
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredCacheEntries(Transaction& t, uint64_t now_ms, uint64_t* removed) {
  std::vector<std::string> expired;
  for (const auto& [key, entry] : TX(t).View().cache_entries) {
    if (entry.expires_at_ms != 0 && entry.expires_at_ms <= now_ms) {
      expired.push_back(key);
    }
  }
  for (const auto& key : expired) {
    TX(t).MutableCacheEntry(key).cache_entries.erase(key);
  }
  if (removed) *removed = expired.size();
  return Result::Ok();
}

uint64_t MemoryRepository::CountCacheEntries(Transaction& t) {
  return TX(t).View().cache_entries.size();
}

} // namespace ctxsync::db::memory
