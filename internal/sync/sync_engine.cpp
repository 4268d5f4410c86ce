#include "sync_engine.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ctxsync::sync {

using model::SyncOutcome;
using model::SyncState;

namespace {

constexpr std::size_t kFetchFanOut = 16;

v1::SourceSystem Contributor(const std::optional<merge::SourceView>& a, const std::optional<merge::SourceView>& b) {
  if (a && b) return v1::SOURCE_SYSTEM_MERGED;
  return a ? v1::SOURCE_SYSTEM_A : v1::SOURCE_SYSTEM_B;
}

std::optional<merge::SourceView> ToView(const std::optional<producer::ProducerSnapshot>& snapshot) {
  if (!snapshot) {
    return std::nullopt;
  }
  return merge::SourceView{snapshot->payload, snapshot->updated_at};
}

} // namespace

// ------------------------------------------------------------
// Per-pass state machine
// ------------------------------------------------------------

class SyncEngine::StateMachine {
 public:
  SyncState State() const {
    return state_;
  }

  void Enter(SyncState next) {
    if (!model::CanTransition(state_, next)) {
      throw util::InvalidState("sync pass: illegal transition " + std::string(model::ToString(state_)) + " -> " + std::string(model::ToString(next)));
    }
    CTXSYNC_LOG_DEBUG("sync pass transition",
                      {observability::StringField("from", model::ToString(state_)), observability::StringField("to", model::ToString(next))});
    state_ = next;
  }

 private:
  SyncState state_ = SyncState::kIdle;
};

std::string SyncEngine::SideFetch::Revision() const {
  if (!reachable) return {};
  return snapshot ? "rev:" + snapshot->source_version : "absent";
}

// ------------------------------------------------------------
// Construction / tracking
// ------------------------------------------------------------

SyncEngine::SyncEngine(std::shared_ptr<version::VersionStore> versions, std::shared_ptr<cache::TierCache> cache,
                       std::shared_ptr<merge::ConflictResolver> resolver, std::shared_ptr<index::VectorIndexer> indexer,
                       std::shared_ptr<producer::ContextProducer> system_a, std::shared_ptr<producer::ContextProducer> system_b, Options options)
    : versions_(std::move(versions)),
      cache_(std::move(cache)),
      resolver_(std::move(resolver)),
      indexer_(std::move(indexer)),
      system_a_(std::move(system_a)),
      system_b_(std::move(system_b)),
      options_(options) {
  if (!versions_ || !cache_ || !resolver_ || !system_a_ || !system_b_) {
    throw std::invalid_argument("SyncEngine: version store, cache, resolver and both producers are required");
  }
}

SyncEngine::~SyncEngine() {
  Stop();
}

void SyncEngine::Track(const std::string& context_id) {
  if (context_id.empty()) {
    throw util::ValidationError("track: context id must not be empty");
  }
  std::lock_guard lock(state_mutex_);
  tracked_.insert(context_id);
}

void SyncEngine::Untrack(const std::string& context_id) {
  std::lock_guard lock(state_mutex_);
  tracked_.erase(context_id);
  revisions_.erase(context_id);
}

std::vector<std::string> SyncEngine::Tracked() const {
  std::lock_guard lock(state_mutex_);
  return {tracked_.begin(), tracked_.end()};
}

SyncCounters SyncEngine::Counters() const {
  std::lock_guard lock(state_mutex_);
  return counters_;
}

std::vector<std::unique_lock<std::mutex>> SyncEngine::LockPass(const std::vector<std::string>& context_ids) {
  std::vector<std::shared_ptr<std::mutex>> mutexes;
  {
    std::lock_guard lock(pass_mutexes_guard_);
    for (const auto& id : context_ids) {
      auto& m = pass_mutexes_[id];
      if (!m) m = std::make_shared<std::mutex>();
      mutexes.push_back(m);
    }
  }

  // context_ids is sorted; acquisition order is global.
  std::vector<std::unique_lock<std::mutex>> locks;
  locks.reserve(mutexes.size());
  for (auto& m : mutexes) {
    locks.emplace_back(*m);
  }
  return locks;
}

// ------------------------------------------------------------
// Fetching
// ------------------------------------------------------------

SyncEngine::SideFetch SyncEngine::FetchSide(producer::ContextProducer& producer, v1::SourceSystem system, const std::string& context_id) {
  try {
    SideFetch fetch;
    fetch.snapshot  = producer.FetchCurrent(context_id, options_.fetch_timeout);
    fetch.reachable = true;
    return fetch;
  } catch (const std::exception& e) {
    throw util::SyncPartialFailure("system " + std::string(merge::SourceName(system)) + " fetch of '" + context_id + "' failed: " + e.what());
  }
}

std::map<std::string, SyncEngine::Fetched> SyncEngine::FetchAll(const std::vector<std::string>& context_ids, SyncPassReport& report) {
  std::map<std::string, Fetched> fetched;

  for (std::size_t offset = 0; offset < context_ids.size(); offset += kFetchFanOut) {
    const auto end = std::min(context_ids.size(), offset + kFetchFanOut);

    std::vector<std::pair<std::future<SideFetch>, std::future<SideFetch>>> inflight;
    inflight.reserve(end - offset);
    for (std::size_t i = offset; i < end; ++i) {
      const auto& id = context_ids[i];
      inflight.emplace_back(std::async(std::launch::async, [this, &id] { return FetchSide(*system_a_, v1::SOURCE_SYSTEM_A, id); }),
                            std::async(std::launch::async, [this, &id] { return FetchSide(*system_b_, v1::SOURCE_SYSTEM_B, id); }));
    }

    for (std::size_t i = offset; i < end; ++i) {
      auto& [future_a, future_b] = inflight[i - offset];
      auto& slot                 = fetched[context_ids[i]];
      for (auto* side : {&future_a, &future_b}) {
        auto& target = side == &future_a ? slot.a : slot.b;
        try {
          target = side->get();
        } catch (const util::SyncPartialFailure& e) {
          report.partial = true;
          CTXSYNC_LOG_WARN("producer unavailable, continuing as partial sync",
                           {observability::ContextField(context_ids[i]), observability::ErrorField(e.what())});
        }
      }
    }
  }
  return fetched;
}

// ------------------------------------------------------------
// Passes
// ------------------------------------------------------------

SyncPassReport SyncEngine::SyncNow(const std::vector<std::string>& context_ids) {
  for (const auto& id : context_ids) {
    if (id.empty()) {
      throw util::ValidationError("sync: context id must not be empty");
    }
  }
  return RunPass(context_ids);
}

SyncPassReport SyncEngine::RunPass(std::vector<std::string> context_ids) {
  const auto started = std::chrono::steady_clock::now();

  std::sort(context_ids.begin(), context_ids.end());
  context_ids.erase(std::unique(context_ids.begin(), context_ids.end()), context_ids.end());

  SyncPassReport report;
  if (context_ids.empty()) {
    return report;
  }

  report.pass_id = util::GenerateUuid();

  observability::SpanScope span("ctxsync.sync.pass");
  span.SetAttribute("ctxsync.sync.pass_id", report.pass_id);
  span.SetAttribute("ctxsync.sync.contexts", static_cast<std::int64_t>(context_ids.size()));

  auto         pass_locks = LockPass(context_ids);
  StateMachine machine;

  // Snapshotting
  machine.Enter(SyncState::kSnapshotting);
  version::SyncSnapshot snapshot;
  try {
    snapshot = versions_->CreateSnapshot(context_ids);
  } catch (const std::exception& e) {
    machine.Enter(SyncState::kIdle);
    report.outcome = SyncOutcome::kAborted;
    report.error   = e.what();
    CTXSYNC_LOG_ERROR("sync snapshot failed", {observability::ErrorField(e.what())});
    Finish(report, started, span);
    return report;
  }

  // Fetching
  machine.Enter(SyncState::kFetching);
  auto fetched = FetchAll(context_ids, report);

  // Merging
  machine.Enter(SyncState::kMerging);

  struct Planned {
    std::optional<merge::SourceView> a;
    std::optional<merge::SourceView> b;
    merge::MergeResult               merged;
    std::size_t                      slot = 0;
  };
  std::map<std::string, Planned>   planned;
  std::map<std::string, Revisions> seen;
  std::map<std::string, Revisions> known;
  {
    std::lock_guard lock(state_mutex_);
    for (const auto& id : context_ids) {
      if (auto it = revisions_.find(id); it != revisions_.end()) known[id] = it->second;
    }
  }

  auto merge_entry = [this](const version::SyncSnapshot::Entry& entry, const Fetched& f, Planned& plan) {
    std::optional<util::Payload> base;
    if (entry.existed) base = util::PayloadFromJson(entry.record.payload_json);
    plan.merged = resolver_->Merge(base ? &*base : nullptr, plan.a, plan.b, merge::Reachability{f.a.reachable, f.b.reachable});
    return !base || !util::PayloadEquals(*base, plan.merged.payload);
  };

  try {
    for (const auto& id : context_ids) {
      const auto& entry = snapshot.Entries().at(id);
      const auto& f     = fetched[id];

      ContextSyncResult result;
      result.context_id = id;

      const bool both_reachable = f.a.reachable && f.b.reachable;
      if (both_reachable) {
        seen[id] = {f.a.Revision(), f.b.Revision()};
      }

      auto known_it = known.find(id);
      if (entry.existed && both_reachable && known_it != known.end() && known_it->second.a == seen[id].a && known_it->second.b == seen[id].b) {
        result.skipped = true;
        report.contexts.push_back(std::move(result));
        continue;
      }

      Planned plan;
      plan.a = ToView(f.a.snapshot);
      plan.b = ToView(f.b.snapshot);
      if (!plan.a && !plan.b) {
        report.contexts.push_back(std::move(result));
        continue;
      }

      const bool changed = merge_entry(entry, f, plan);
      result.report      = plan.merged.report;
      report.conflicts += plan.merged.report.conflicts.size();
      if (plan.merged.report.partial) report.partial = true;

      plan.slot = report.contexts.size();
      report.contexts.push_back(std::move(result));
      if (changed) {
        planned.emplace(id, std::move(plan));
      }
    }
  } catch (const std::exception& e) {
    // Nothing was written yet; releasing the snapshot is the whole rollback.
    machine.Enter(SyncState::kRollingBack);
    versions_->DiscardSnapshot(snapshot);
    report.outcome = SyncOutcome::kRolledBack;
    report.error   = e.what();
    CTXSYNC_LOG_ERROR("sync merge failed", {observability::ErrorField(e.what())});
    machine.Enter(SyncState::kIdle);
    Finish(report, started, span);
    return report;
  }

  auto remember_revisions = [&] {
    std::lock_guard lock(state_mutex_);
    for (const auto& [id, revs] : seen) {
      revisions_[id] = revs;
    }
  };

  if (planned.empty()) {
    machine.Enter(SyncState::kIdle);
    versions_->DiscardSnapshot(snapshot);
    remember_revisions();
    Finish(report, started, span);
    return report;
  }

  // Committing
  machine.Enter(SyncState::kCommitting);
  std::vector<std::string> commit_ids;
  for (const auto& [id, _] : planned) commit_ids.push_back(id);

  std::vector<std::pair<std::string, uint64_t>> committed;
  std::vector<index::IndexEntry>                to_index;
  {
    // Refresh, restore and discard walk every snapshot entry, not only the
    // contexts being committed.
    auto locks = versions_->LockContexts(context_ids);

    try {
      for (const auto& moved : versions_->RefreshSnapshot(snapshot, locks)) {
        auto it = planned.find(moved);
        if (it == planned.end()) continue;
        CTXSYNC_LOG_INFO("context moved during sync pass, merging against committed state", {observability::ContextField(moved)});
        merge_entry(snapshot.Entries().at(moved), fetched[moved], it->second);
        report.contexts[it->second.slot].report = it->second.merged.report;
      }

      for (auto& [id, plan] : planned) {
        version::CommitOptions opts;
        opts.change_type                    = "sync";
        opts.extra_metadata["conflicts"]    = plan.merged.report.Summary();
        opts.extra_metadata["partial_sync"] = plan.merged.report.partial ? "true" : "false";

        const auto source  = Contributor(plan.a, plan.b);
        const auto version = versions_->Commit(locks, id, plan.merged.payload, source, opts);
        committed.emplace_back(id, version);

        auto& result     = report.contexts[plan.slot];
        result.committed = true;
        result.version   = version;
        to_index.push_back({id, version, source, plan.merged.payload});
      }

      for (const auto& [id, version] : committed) {
        cache_->Invalidate(id);
        cache_->Set(id, versions_->GetCurrent(id), model::CacheTier::kL3);
      }
      versions_->DiscardSnapshot(snapshot, locks);
    } catch (const std::exception& e) {
      machine.Enter(SyncState::kRollingBack);
      span.AddEvent("ctxsync.sync.rollback");
      report.error = e.what();
      for (auto& result : report.contexts) {
        result.committed = false;
        result.version   = 0;
      }

      try {
        versions_->RestoreSnapshot(snapshot, locks);
        report.outcome = SyncOutcome::kRolledBack;
        CTXSYNC_LOG_WARN("sync pass rolled back", {observability::ErrorField(e.what())});
      } catch (const std::exception& restore_error) {
        util::SyncFatalFailure fatal(std::string("restore after failed commit: ") + restore_error.what());
        report.outcome = SyncOutcome::kAborted;
        report.error   = fatal.what();
        CTXSYNC_LOG_ERROR("sync pass aborted", {observability::ErrorField(fatal.what())});
        try {
          versions_->DiscardSnapshot(snapshot, locks);
        } catch (const std::exception& discard_error) {
          CTXSYNC_LOG_ERROR("sync snapshot release failed", {observability::ErrorField(discard_error.what())});
        }
      }

      for (const auto& id : commit_ids) {
        cache_->Invalidate(id);
      }
      for (const auto& [id, version] : committed) {
        cache_->Invalidate(cache::TierCache::VersionKey(id, version));
      }

      machine.Enter(SyncState::kIdle);
      Finish(report, started, span);
      return report;
    }
  }
  remember_revisions();

  // Indexing
  machine.Enter(SyncState::kIndexing);
  if (indexer_) {
    try {
      report.indexed = indexer_->Update(to_index);
    } catch (const std::exception& e) {
      report.indexed.failed = to_index.size();
      CTXSYNC_LOG_WARN("vector indexing failed", {observability::ErrorField(e.what())});
    }
    if (report.indexed.failed > 0) {
      report.outcome = SyncOutcome::kPartialIndexFailure;
    }
  }
  machine.Enter(SyncState::kIdle);

  Finish(report, started, span);
  return report;
}

void SyncEngine::Finish(SyncPassReport& report, std::chrono::steady_clock::time_point started, observability::SpanScope& span) {
  report.latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  span.SetAttribute("ctxsync.sync.outcome", model::ToString(report.outcome));
  span.SetAttribute("ctxsync.sync.conflicts", static_cast<std::int64_t>(report.conflicts));
  if (!report.error.empty()) {
    span.RecordException(report.error);
  }

  {
    std::lock_guard lock(state_mutex_);
    ++counters_.passes;
    switch (report.outcome) {
      case SyncOutcome::kCommitted:
        ++counters_.committed;
        break;
      case SyncOutcome::kRolledBack:
        ++counters_.rolled_back;
        break;
      case SyncOutcome::kPartialIndexFailure:
        ++counters_.committed;
        ++counters_.partial_index_failures;
        break;
      case SyncOutcome::kAborted:
        ++counters_.aborted;
        break;
    }
    if (report.partial) ++counters_.partial_syncs;
    counters_.conflicts += report.conflicts;
    counters_.last_latency_ms = static_cast<uint64_t>(report.latency.count());
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.RecordSyncPass(model::ToString(report.outcome));
  metrics.ObserveSyncLatencyMs(static_cast<double>(report.latency.count()));
  metrics.RecordSyncConflicts(report.conflicts);

  CTXSYNC_LOG_INFO("sync pass finished",
                   {observability::StringField("pass_id", report.pass_id), observability::StringField("outcome", model::ToString(report.outcome)),
                    observability::UintField("contexts", report.contexts.size()), observability::UintField("conflicts", report.conflicts), observability::BoolField("partial", report.partial),
                    observability::IntField("latency_ms", report.latency.count())});
}

// ------------------------------------------------------------
// Background loop
// ------------------------------------------------------------

void SyncEngine::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SyncEngine::Loop, this);
}

void SyncEngine::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SyncEngine::Loop() {
  std::unique_lock lock(wake_mutex_);
  while (running_) {
    wake_.wait_for(lock, options_.interval, [this] { return !running_; });
    if (!running_) {
      break;
    }
    lock.unlock();

    auto ids = Tracked();
    if (!ids.empty()) {
      try {
        RunPass(std::move(ids));
      } catch (const std::exception& e) {
        CTXSYNC_LOG_ERROR("sync loop pass failed", {observability::ErrorField(e.what())});
      }
    }
    if (indexer_) {
      indexer_->RetryPending();
    }

    lock.lock();
  }
}

} // namespace ctxsync::sync
