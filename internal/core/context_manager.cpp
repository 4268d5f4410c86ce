#include "context_manager.hpp"

#include <chrono>
#include <type_traits>

#include "internal/merge/conflict_resolver.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ctxsync::core {

namespace {

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& context_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!context_id.empty()) {
    span.SetAttribute("ctxsync.context_id", context_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    CTXSYNC_LOG_ERROR("call failed", {observability::StringField("route", route), observability::ContextField(context_id),
                                      observability::ErrorField(ex.what())});
    finish(false);
    throw;
  }
}

void ThrowIfCancelled(const std::stop_token& stop, std::string_view op) {
  if (stop.stop_requested()) {
    throw util::Cancelled(std::string(op) + ": cancelled by caller");
  }
}

void RequireId(const std::string& context_id, std::string_view op) {
  if (context_id.empty()) {
    throw util::ValidationError(std::string(op) + ": context id must not be empty");
  }
}

v1::Context FromVersion(const v1::ContextVersion& version) {
  v1::Context context;
  context.set_id(version.context_id());
  context.set_current_version(version.version_number());
  *context.mutable_payload()    = version.payload();
  context.set_source_system(version.source_system());
  *context.mutable_updated_at() = version.created_at();
  return context;
}

} // namespace

ContextManager::ContextManager(std::shared_ptr<version::VersionStore> versions, std::shared_ptr<cache::TierCache> cache,
                               std::shared_ptr<index::VectorIndexer> indexer, std::shared_ptr<sync::SyncEngine> sync)
    : versions_(std::move(versions)), cache_(std::move(cache)), indexer_(std::move(indexer)), sync_(std::move(sync)) {
  if (!versions_ || !cache_) {
    throw std::invalid_argument("ContextManager: version store and cache are required");
  }
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

uint64_t ContextManager::Store(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source) {
  return ObserveCall("ContextManager.Store", context_id, [&] {
    RequireId(context_id, "store");
    if (source == v1::SOURCE_SYSTEM_UNSPECIFIED || !v1::SourceSystem_IsValid(source)) {
      throw util::ValidationError("store: source system must be A, B or merged");
    }

    const auto version = versions_->Commit(context_id, payload, source);
    cache_->Invalidate(context_id);

    if (indexer_) {
      indexer_->Enqueue({{context_id, version, source, payload}});
    }
    return version;
  });
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

v1::Context ContextManager::Get(const std::string& context_id, const GetOptions& options) {
  return ObserveCall("ContextManager.Get", context_id, [&] {
    RequireId(context_id, "get");
    ThrowIfCancelled(options.stop, "get");

    if (auto cached = cache_->Get(context_id); cached && cached->current_version() >= options.min_version) {
      return std::move(*cached);
    }

    const auto token   = cache_->BeginFill(context_id);
    auto       context = versions_->GetCurrent(context_id);
    ThrowIfCancelled(options.stop, "get");

    cache_->Fill(context_id, token, context, cache_->FillTier());
    return context;
  });
}

v1::Context ContextManager::GetVersion(const std::string& context_id, uint64_t version_number, std::stop_token stop) {
  return ObserveCall("ContextManager.GetVersion", context_id, [&] {
    RequireId(context_id, "get version");
    ThrowIfCancelled(stop, "get version");

    const auto key = cache::TierCache::VersionKey(context_id, version_number);
    if (auto cached = cache_->Get(key)) {
      return std::move(*cached);
    }

    const auto token   = cache_->BeginFill(key);
    auto       context = FromVersion(versions_->GetVersion(context_id, version_number));
    ThrowIfCancelled(stop, "get version");

    cache_->Fill(key, token, context, cache_->FillTier());
    return context;
  });
}

std::vector<v1::ContextVersion> ContextManager::ListVersions(const std::string& context_id, uint64_t limit, std::optional<uint64_t> before_version) {
  return ObserveCall("ContextManager.ListVersions", context_id, [&] {
    RequireId(context_id, "list versions");
    if (limit == 0) {
      throw util::ValidationError("list versions: limit must be positive");
    }
    return versions_->ListVersions(context_id, limit, before_version);
  });
}

std::vector<index::ScoredContext> ContextManager::SearchSimilar(const index::EmbeddingVector& embedding, uint32_t limit, float threshold,
                                                                std::stop_token stop) {
  return ObserveCall("ContextManager.SearchSimilar", "", [&] {
    ThrowIfCancelled(stop, "search");
    if (embedding.empty()) {
      throw util::ValidationError("search: embedding must not be empty");
    }
    if (!indexer_) {
      return std::vector<index::ScoredContext>{};
    }

    auto matches = indexer_->Search(embedding, limit, threshold);
    ThrowIfCancelled(stop, "search");
    return matches;
  });
}

// ------------------------------------------------------------
// Merges
// ------------------------------------------------------------

std::string ContextManager::MergeContexts(const std::vector<std::string>& context_ids, const std::string& strategy) {
  return ObserveCall("ContextManager.MergeContexts", "", [&] {
    if (context_ids.empty()) {
      throw util::ValidationError("merge: at least one context id is required");
    }
    const auto parsed = merge::ParseMergeStrategy(strategy);

    std::vector<v1::Context> found;
    for (const auto& id : context_ids) {
      if (auto context = versions_->FindCurrent(id)) {
        found.push_back(std::move(*context));
      } else {
        CTXSYNC_LOG_WARN("merge source not found, skipping", {observability::ContextField(id)});
      }
    }
    if (found.empty()) {
      throw util::NotFoundError("merge: none of the requested contexts exist");
    }

    version::CommitOptions opts;
    opts.change_type                = "merge";
    opts.parent_id                  = found.front().id();
    opts.extra_metadata["strategy"] = std::string(merge::ToString(parsed));
    opts.extra_metadata["sources"]  = std::to_string(found.size());

    const auto merged_id = util::GenerateShortId("merged_");
    const auto payload   = merge::MergeMany(found, parsed);
    const auto version   = versions_->Commit(merged_id, payload, v1::SOURCE_SYSTEM_MERGED, opts);
    cache_->Invalidate(merged_id);

    if (indexer_) {
      indexer_->Enqueue({{merged_id, version, v1::SOURCE_SYSTEM_MERGED, payload}});
    }

    CTXSYNC_LOG_INFO("contexts merged", {observability::ContextField(merged_id), observability::UintField("sources", found.size()),
                                         observability::StringField("strategy", merge::ToString(parsed))});
    return merged_id;
  });
}

// ------------------------------------------------------------
// Sync and maintenance
// ------------------------------------------------------------

void ContextManager::TrackForSync(const std::string& context_id) {
  ObserveCall("ContextManager.TrackForSync", context_id, [&] {
    RequireId(context_id, "track");
    if (!sync_) {
      throw util::InvalidState("track: synchronization is not configured");
    }
    sync_->Track(context_id);
  });
}

sync::SyncPassReport ContextManager::SyncNow(const std::vector<std::string>& context_ids) {
  return ObserveCall("ContextManager.SyncNow", "", [&] {
    if (!sync_) {
      throw util::InvalidState("sync: synchronization is not configured");
    }
    return sync_->SyncNow(context_ids.empty() ? sync_->Tracked() : context_ids);
  });
}

uint64_t ContextManager::WarmCache(const std::vector<std::string>& context_ids) {
  return ObserveCall("ContextManager.WarmCache", "", [&] {
    const auto ids = context_ids.empty() ? versions_->ListContextIds() : context_ids;
    return cache_->Warm(ids, [this](const std::string& id) { return versions_->FindCurrent(id); });
  });
}

ManagerMetrics ContextManager::Metrics() {
  ManagerMetrics metrics;
  metrics.versions         = versions_->Stats();
  metrics.cache            = cache_->Metrics();
  metrics.sync_enabled     = sync_ != nullptr;
  metrics.indexing_enabled = indexer_ != nullptr;
  if (sync_) {
    metrics.sync = sync_->Counters();
  }
  if (indexer_) {
    metrics.pending_index = indexer_->PendingCount();
  }
  return metrics;
}

} // namespace ctxsync::core
