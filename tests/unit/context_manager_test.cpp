#include "internal/core/context_manager.hpp"

#include <cassert>
#include <future>
#include <iostream>
#include <memory>
#include <stop_token>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ctxsync::core::ContextManager;
using ctxsync::core::GetOptions;
using ctxsync::util::PayloadFromJson;
using ctxsync::v1::SOURCE_SYSTEM_A;
using ctxsync::v1::SOURCE_SYSTEM_B;

class RecordingStore final : public ctxsync::index::VectorStore {
 public:
  void Upsert(const std::vector<ctxsync::index::VectorRecord>& records) override {
    for (const auto& record : records) ids.push_back(record.context_id);
  }
  std::vector<ctxsync::index::ScoredContext> Query(const ctxsync::index::EmbeddingVector&, uint32_t limit, float) override {
    std::vector<ctxsync::index::ScoredContext> out;
    for (const auto& id : ids) {
      if (out.size() == limit) break;
      out.push_back({id, 0.9f});
    }
    return out;
  }
  std::vector<std::string> ids;
};

class ConstantEmbedder final : public ctxsync::index::Embedder {
 public:
  std::vector<ctxsync::index::EmbeddingVector> Embed(const std::vector<std::string>& texts) override {
    return std::vector<ctxsync::index::EmbeddingVector>(texts.size(), {1.0f, 0.0f});
  }
};

struct Harness {
  explicit Harness(bool with_indexer = false) {
    versions = std::make_shared<ctxsync::version::VersionStore>(std::make_shared<ctxsync::db::memory::MemoryRepository>(),
                                                                ctxsync::version::VersionStore::Options{});
    cache    = std::make_shared<ctxsync::cache::TierCache>(std::make_shared<ctxsync::cache::MemoryTier>(ctxsync::cache::MemoryTier::Options{}), nullptr,
                                                        nullptr, ctxsync::cache::TierCache::Options{});
    if (with_indexer) {
      store   = std::make_shared<RecordingStore>();
      indexer = std::make_shared<ctxsync::index::VectorIndexer>(std::make_shared<ConstantEmbedder>(), store, ctxsync::index::VectorIndexer::Options{});
    }
    manager = std::make_unique<ContextManager>(versions, cache, indexer, nullptr);
  }

  std::shared_ptr<ctxsync::version::VersionStore> versions;
  std::shared_ptr<ctxsync::cache::TierCache>      cache;
  std::shared_ptr<RecordingStore>                 store;
  std::shared_ptr<ctxsync::index::VectorIndexer>  indexer;
  std::unique_ptr<ContextManager>                 manager;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestReadYourWrites() {
  Harness h;
  assert(h.manager->Store("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A) == 1);
  assert(h.manager->Get("ctx").payload().fields().at("v").number_value() == 1);

  // Cached now; the next write must still be visible immediately.
  assert(h.manager->Store("ctx", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_B) == 2);
  auto current = h.manager->Get("ctx");
  assert(current.current_version() == 2);
  assert(current.source_system() == SOURCE_SYSTEM_B);
}

void TestMinVersionBypassesOlderCacheEntry() {
  Harness h;
  h.manager->Store("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);
  (void)h.manager->Get("ctx");

  // A write that skipped the manager leaves a stale cache entry behind.
  h.versions->Commit("ctx", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_A);
  assert(h.manager->Get("ctx").current_version() == 1);

  GetOptions opts;
  opts.min_version = 2;
  assert(h.manager->Get("ctx", opts).current_version() == 2);
  assert(h.manager->Get("ctx").current_version() == 2);
}

void TestValidationAndNotFound() {
  Harness h;
  assert(Throws<ctxsync::util::ValidationError>([&] { h.manager->Store("", PayloadFromJson("{}"), SOURCE_SYSTEM_A); }));
  assert(Throws<ctxsync::util::ValidationError>([&] { h.manager->Store("x", PayloadFromJson("{}"), ctxsync::v1::SOURCE_SYSTEM_UNSPECIFIED); }));
  assert(Throws<ctxsync::util::NotFoundError>([&] { (void)h.manager->Get("missing"); }));
  assert(Throws<ctxsync::util::ValidationError>([&] { (void)h.manager->Get(""); }));
  assert(Throws<ctxsync::util::ValidationError>([&] { (void)h.manager->ListVersions("x", 0); }));
  assert(Throws<ctxsync::util::NotFoundError>([&] { (void)h.manager->ListVersions("missing", 10); }));
  assert(Throws<ctxsync::util::InvalidState>([&] { h.manager->TrackForSync("x"); }));
  assert(Throws<ctxsync::util::InvalidState>([&] { (void)h.manager->SyncNow({"x"}); }));
}

void TestCancelledCallsDoNotRun() {
  Harness h;
  h.manager->Store("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);

  std::stop_source source;
  source.request_stop();

  GetOptions opts;
  opts.stop = source.get_token();
  assert(Throws<ctxsync::util::Cancelled>([&] { (void)h.manager->Get("ctx", opts); }));
  assert(Throws<ctxsync::util::Cancelled>([&] { (void)h.manager->GetVersion("ctx", 1, source.get_token()); }));
  assert(Throws<ctxsync::util::Cancelled>([&] { (void)h.manager->SearchSimilar({1.0f}, 5, 0.5f, source.get_token()); }));
  assert(h.cache->Metrics().requests == 0);
}

void TestGetVersionServesHistory() {
  Harness h;
  h.manager->Store("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);
  h.manager->Store("ctx", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_B);

  auto first = h.manager->GetVersion("ctx", 1);
  assert(first.current_version() == 1);
  assert(first.payload().fields().at("v").number_value() == 1);
  assert(first.source_system() == SOURCE_SYSTEM_A);

  (void)h.manager->GetVersion("ctx", 1);
  assert(h.cache->Metrics().hits == 1);
  assert(Throws<ctxsync::util::NotFoundError>([&] { (void)h.manager->GetVersion("ctx", 9); }));

  auto listed = h.manager->ListVersions("ctx", 1);
  assert(listed.size() == 1 && listed[0].version_number() == 2);
}

void TestMergeContextsStrategies() {
  Harness h;
  h.manager->Store("left", PayloadFromJson(R"({"a":1,"shared":"l"})"), SOURCE_SYSTEM_A);
  h.manager->Store("right", PayloadFromJson(R"({"b":2,"shared":"r"})"), SOURCE_SYSTEM_B);

  const auto unioned = h.manager->MergeContexts({"left", "right", "nope"}, "union");
  assert(unioned.rfind("merged_", 0) == 0);
  assert(unioned.size() == std::string("merged_").size() + 8);

  auto merged = h.manager->Get(unioned);
  assert(merged.source_system() == ctxsync::v1::SOURCE_SYSTEM_MERGED);
  assert(merged.parent_id() == "left");
  assert(merged.payload().fields().size() == 3);
  assert(merged.payload().fields().at("shared").string_value() == "r");

  auto history = h.manager->ListVersions(unioned, 10);
  assert(history[0].metadata().at("change_type") == "merge");
  assert(history[0].metadata().at("strategy") == "union");
  assert(history[0].metadata().at("sources") == "2");

  const auto common = h.manager->MergeContexts({"left", "right"}, "intersection");
  assert(common != unioned);
  assert(h.manager->Get(common).payload().fields().size() == 1);

  assert(Throws<ctxsync::util::ValidationError>([&] { (void)h.manager->MergeContexts({"left"}, "average"); }));
  assert(Throws<ctxsync::util::ValidationError>([&] { (void)h.manager->MergeContexts({}, "union"); }));
  assert(Throws<ctxsync::util::NotFoundError>([&] { (void)h.manager->MergeContexts({"nope"}, "latest"); }));
}

void TestSearchSimilar() {
  Harness plain;
  assert(plain.manager->SearchSimilar({1.0f}, 5, 0.5f).empty());
  assert(Throws<ctxsync::util::ValidationError>([&] { (void)plain.manager->SearchSimilar({}, 5, 0.5f); }));

  Harness indexed(true);
  indexed.manager->Store("one", PayloadFromJson(R"({"topic":"cats"})"), SOURCE_SYSTEM_A);
  indexed.manager->Store("two", PayloadFromJson(R"({"topic":"dogs"})"), SOURCE_SYSTEM_A);
  assert(indexed.store->ids.empty() && "store only queues for indexing");
  assert(indexed.manager->Metrics().pending_index == 2);

  auto flushed = indexed.indexer->RetryPending();
  assert(flushed.indexed == 2 && flushed.failed == 0);
  auto matches = indexed.manager->SearchSimilar({1.0f, 0.0f}, 1, 0.5f);
  assert(matches.size() == 1 && matches[0].context_id == "one");
  assert(indexed.manager->Metrics().indexing_enabled);
  assert(indexed.manager->Metrics().pending_index == 0);
}

// Embedder that parks inside Embed until released.
class GatedEmbedder final : public ctxsync::index::Embedder {
 public:
  std::vector<ctxsync::index::EmbeddingVector> Embed(const std::vector<std::string>& texts) override {
    entered.set_value();
    release.wait();
    return std::vector<ctxsync::index::EmbeddingVector>(texts.size(), {1.0f, 0.0f});
  }

  std::promise<void>       entered;
  std::shared_future<void> release;
};

void TestStoreDoesNotWaitOnSlowEmbedder() {
  Harness h;
  auto    embedder = std::make_shared<GatedEmbedder>();
  auto    store    = std::make_shared<RecordingStore>();
  auto    indexer  = std::make_shared<ctxsync::index::VectorIndexer>(embedder, store, ctxsync::index::VectorIndexer::Options{});
  ContextManager manager(h.versions, h.cache, indexer, nullptr);

  std::promise<void> gate;
  embedder->release = gate.get_future().share();
  auto entered      = embedder->entered.get_future();

  manager.Store("first", PayloadFromJson(R"({"n":1})"), SOURCE_SYSTEM_A);
  ctxsync::index::IndexResult flushed;
  std::thread flusher([&] { flushed = indexer->RetryPending(); });
  entered.wait();

  // The flush above is parked in Embed; writes and metrics still complete.
  assert(manager.Store("second", PayloadFromJson(R"({"n":2})"), SOURCE_SYSTEM_B) == 1);
  assert(manager.Get("second").current_version() == 1);
  assert(manager.Metrics().pending_index == 1);

  gate.set_value();
  flusher.join();
  assert(flushed.indexed == 1);
  assert(store->ids.size() == 1 && store->ids[0] == "first");
}

void TestWarmCacheAndMetrics() {
  Harness h;
  h.versions->Commit("a", PayloadFromJson("{}"), SOURCE_SYSTEM_A);
  h.versions->Commit("b", PayloadFromJson("{}"), SOURCE_SYSTEM_A);

  assert(h.manager->WarmCache() == 2);
  (void)h.manager->Get("a");
  (void)h.manager->Get("b");

  auto metrics = h.manager->Metrics();
  assert(metrics.versions.contexts == 2);
  assert(metrics.cache.hits == 2 && metrics.cache.hit_rate == 1.0);
  assert(metrics.cache.meets_target);
  assert(!metrics.sync_enabled);
}

void TestConcurrentWritersAndReaders() {
  Harness                  h;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 20; ++i) {
        const auto version = h.manager->Store("hot", PayloadFromJson(R"({"t":)" + std::to_string(t) + "}"), SOURCE_SYSTEM_A);
        GetOptions opts;
        opts.min_version = version;
        assert(h.manager->Get("hot", opts).current_version() >= version);
      }
    });
  }
  for (auto& thread : threads) thread.join();
  assert(h.manager->Get("hot").current_version() == 80);
}

} // namespace

int main() {
  TestReadYourWrites();
  TestMinVersionBypassesOlderCacheEntry();
  TestValidationAndNotFound();
  TestCancelledCallsDoNotRun();
  TestGetVersionServesHistory();
  TestMergeContextsStrategies();
  TestSearchSimilar();
  TestStoreDoesNotWaitOnSlowEmbedder();
  TestWarmCacheAndMetrics();
  TestConcurrentWritersAndReaders();

  std::cout << "ctxsync_unit_context_manager: pass\n";
  return 0;
}
