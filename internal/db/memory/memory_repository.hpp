#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace ctxsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertContext(Transaction&, const model::ContextRecord&) override;
  std::optional<model::ContextRecord> GetContext(Transaction&, const std::string&) override;
  Result                              UpdateContext(Transaction&, const model::ContextRecord&, uint64_t expected_version) override;
  Result                              DeleteContext(Transaction&, const std::string&) override;
  std::vector<std::string>            ListContextIds(Transaction&) override;
  uint64_t                            CountContexts(Transaction&) override;

  Result                                     InsertVersion(Transaction&, const model::ContextVersionRecord&) override;
  std::optional<model::ContextVersionRecord> GetVersion(Transaction&, const std::string& context_id, uint64_t version) override;
  std::vector<model::ContextVersionRecord>   ListVersions(Transaction&, const std::string& context_id, std::optional<uint64_t> before_version,
                                                          uint64_t limit) override;
  uint64_t                                   CountVersions(Transaction&, const std::string& context_id) override;
  uint64_t                                   CountAllVersions(Transaction&) override;
  Result DeleteVersionsAbove(Transaction&, const std::string& context_id, uint64_t max_version) override;
  Result TrimVersionsToMaxCount(Transaction&, const std::string& context_id, uint64_t max_versions, uint64_t* removed) override;

  Result                                 UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) override;
  Result                                 DeleteCacheEntry(Transaction&, const std::string& key) override;
  Result                                 DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms, uint64_t* removed) override;
  uint64_t                               CountCacheEntries(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::ContextRecord>                                   contexts;
    std::map<std::string, std::map<uint64_t, model::ContextVersionRecord>>        versions;
    std::map<std::string, model::CacheEntryRecord>                                cache_entries;
  };

  // Bumped every time a committed transaction writes the row.
  struct Stamps {
    std::unordered_map<std::string, uint64_t> contexts;
    std::unordered_map<std::string, uint64_t> cache_entries;
  };

  std::mutex mutex_;
  State      committed_;
  Stamps     stamps_;
};

} // namespace ctxsync::db::memory
