#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/cache/tier_cache.hpp"
#include "internal/index/vector_indexer.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/version/version_store.hpp"

namespace ctxsync::core {

struct GetOptions {
  // Read-your-writes token: cached values older than this are bypassed.
  uint64_t min_version = 0;

  std::stop_token stop;
};

struct ManagerMetrics {
  version::VersionStoreStats versions;
  cache::CacheMetrics        cache;
  sync::SyncCounters         sync;
  bool                       sync_enabled     = false;
  bool                       indexing_enabled = false;
  std::size_t                pending_index    = 0;
};

/*
  Caller-facing entry point.

  Reads go through the tier cache and fall back to the version store;
  writes commit first and invalidate the cache before returning, so a
  caller always reads its own write. Safe to call from any thread.

  Callers see results or one of util::ValidationError,
  util::NotFoundError, util::ConflictCommitError and util::Cancelled.
*/
class ContextManager {
 public:
  ContextManager(std::shared_ptr<version::VersionStore> versions, std::shared_ptr<cache::TierCache> cache, std::shared_ptr<index::VectorIndexer> indexer,
                 std::shared_ptr<sync::SyncEngine> sync);

  uint64_t Store(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source);

  v1::Context Get(const std::string& context_id, const GetOptions& options = {});

  // The context as of version_number, served under "<id>@v<N>".
  v1::Context GetVersion(const std::string& context_id, uint64_t version_number, std::stop_token stop = {});

  std::vector<v1::ContextVersion> ListVersions(const std::string& context_id, uint64_t limit, std::optional<uint64_t> before_version = std::nullopt);

  // Empty when indexing is not configured.
  std::vector<index::ScoredContext> SearchSimilar(const index::EmbeddingVector& embedding, uint32_t limit, float threshold, std::stop_token stop = {});

  // Returns the id of the new "merged_xxxxxxxx" context.
  std::string MergeContexts(const std::vector<std::string>& context_ids, const std::string& strategy);

  void                 TrackForSync(const std::string& context_id);
  sync::SyncPassReport SyncNow(const std::vector<std::string>& context_ids);

  // Loads the given contexts (all stored contexts when empty) into the cache.
  uint64_t WarmCache(const std::vector<std::string>& context_ids = {});

  ManagerMetrics Metrics();

 private:
  std::shared_ptr<version::VersionStore> versions_;
  std::shared_ptr<cache::TierCache>      cache_;
  std::shared_ptr<index::VectorIndexer>  indexer_;
  std::shared_ptr<sync::SyncEngine>      sync_;
};

} // namespace ctxsync::core
