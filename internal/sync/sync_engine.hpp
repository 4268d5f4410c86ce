#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/cache/tier_cache.hpp"
#include "internal/index/vector_indexer.hpp"
#include "internal/merge/conflict_resolver.hpp"
#include "internal/model/sync_state.hpp"
#include "internal/observability/spans.hpp"
#include "internal/producer/context_producer.hpp"
#include "internal/version/version_store.hpp"

namespace ctxsync::sync {

struct ContextSyncResult {
  std::string context_id;

  // Unchanged producer revisions; nothing fetched was merged.
  bool skipped = false;

  bool     committed = false;
  uint64_t version   = 0;

  merge::ConflictReport report;
};

struct SyncPassReport {
  // Correlates log lines and the trace span of one pass.
  std::string                    pass_id;
  model::SyncOutcome             outcome = model::SyncOutcome::kCommitted;
  std::vector<ContextSyncResult> contexts;

  uint64_t                  conflicts = 0;
  bool                      partial   = false;
  index::IndexResult        indexed;
  std::chrono::milliseconds latency{0};

  // Failure detail for RolledBack and Aborted.
  std::string error;

  bool Succeeded() const {
    return outcome == model::SyncOutcome::kCommitted || outcome == model::SyncOutcome::kPartialIndexFailure;
  }
};

struct SyncCounters {
  uint64_t passes                 = 0;
  uint64_t committed              = 0;
  uint64_t rolled_back            = 0;
  uint64_t aborted                = 0;
  uint64_t partial_index_failures = 0;
  uint64_t partial_syncs          = 0;
  uint64_t conflicts              = 0;
  uint64_t last_latency_ms        = 0;
};

/*
  Pulls System A and System B, merges their views and commits the result
  under a compensating snapshot.

  A pass walks Idle -> Snapshotting -> Fetching -> Merging -> Committing ->
  Indexing -> Idle. A commit failure restores the snapshot; a failed
  restore aborts the pass. Overlapping passes serialize per context.
*/
class SyncEngine {
 public:
  struct Options {
    std::chrono::milliseconds interval{std::chrono::seconds(5)};
    std::chrono::milliseconds fetch_timeout{std::chrono::seconds(2)};
  };

  SyncEngine(std::shared_ptr<version::VersionStore> versions, std::shared_ptr<cache::TierCache> cache, std::shared_ptr<merge::ConflictResolver> resolver,
             std::shared_ptr<index::VectorIndexer> indexer, std::shared_ptr<producer::ContextProducer> system_a,
             std::shared_ptr<producer::ContextProducer> system_b, Options options);
  ~SyncEngine();

  SyncEngine(const SyncEngine&)            = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  SyncPassReport SyncNow(const std::vector<std::string>& context_ids);

  void                     Track(const std::string& context_id);
  void                     Untrack(const std::string& context_id);
  std::vector<std::string> Tracked() const;

  SyncCounters Counters() const;

  void Start();
  void Stop();

 private:
  struct SideFetch {
    bool                                       reachable = false;
    std::optional<producer::ProducerSnapshot> snapshot;

    std::string Revision() const;
  };

  struct Fetched {
    SideFetch a;
    SideFetch b;
  };

  struct Revisions {
    std::string a;
    std::string b;
  };

  class StateMachine;

  std::vector<std::unique_lock<std::mutex>> LockPass(const std::vector<std::string>& context_ids);

  SideFetch FetchSide(producer::ContextProducer& producer, v1::SourceSystem system, const std::string& context_id);
  std::map<std::string, Fetched> FetchAll(const std::vector<std::string>& context_ids, SyncPassReport& report);

  SyncPassReport RunPass(std::vector<std::string> context_ids);
  void           Finish(SyncPassReport& report, std::chrono::steady_clock::time_point started, observability::SpanScope& span);

  void Loop();

  std::shared_ptr<version::VersionStore>     versions_;
  std::shared_ptr<cache::TierCache>          cache_;
  std::shared_ptr<merge::ConflictResolver>   resolver_;
  std::shared_ptr<index::VectorIndexer>      indexer_;
  std::shared_ptr<producer::ContextProducer> system_a_;
  std::shared_ptr<producer::ContextProducer> system_b_;
  Options                                    options_;

  std::mutex                                                    pass_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> pass_mutexes_;

  mutable std::mutex                               state_mutex_;
  std::set<std::string>                            tracked_;
  std::unordered_map<std::string, Revisions>       revisions_;
  SyncCounters                                     counters_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace ctxsync::sync
