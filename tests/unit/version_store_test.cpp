#include "internal/version/version_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/forwarding_repository.hpp"

namespace {

using ctxsync::util::PayloadFromJson;
using ctxsync::v1::SOURCE_SYSTEM_A;
using ctxsync::v1::SOURCE_SYSTEM_B;
using ctxsync::version::CommitOptions;
using ctxsync::version::VersionStore;

std::shared_ptr<ctxsync::db::memory::MemoryRepository> NewRepo() {
  return std::make_shared<ctxsync::db::memory::MemoryRepository>();
}

VersionStore NewStore(std::shared_ptr<ctxsync::db::Repository> repo, uint32_t retention = 100, uint64_t max_bytes = 10 * 1024 * 1024) {
  return VersionStore(std::move(repo), VersionStore::Options{retention, max_bytes});
}

// Fails UpdateContext with a CAS conflict a fixed number of times.
class ConflictingRepository final : public ctxsync::testing::ForwardingRepository {
 public:
  ConflictingRepository(std::shared_ptr<ctxsync::db::Repository> inner, int failures)
      : ForwardingRepository(std::move(inner)), failures_(failures) {
  }

  ctxsync::db::Result UpdateContext(ctxsync::db::Transaction& tx, const ctxsync::db::model::ContextRecord& r, uint64_t expected) override {
    if (failures_ > 0) {
      --failures_;
      return ctxsync::db::Result::Err(ctxsync::db::ErrorCode::Conflict, "version moved");
    }
    return inner_->UpdateContext(tx, r, expected);
  }

 private:
  int failures_;
};

void TestVersionsIncreaseAndCarryMetadata() {
  auto store = NewStore(NewRepo());

  assert(store.Commit("ctx", PayloadFromJson(R"({"a":1,"b":"x"})"), SOURCE_SYSTEM_A) == 1);
  assert(store.Commit("ctx", PayloadFromJson(R"({"a":2,"c":true})"), SOURCE_SYSTEM_B) == 2);

  auto current = store.GetCurrent("ctx");
  assert(current.current_version() == 2);
  assert(current.source_system() == SOURCE_SYSTEM_B);
  assert(current.payload().fields().at("a").number_value() == 2);

  auto first = store.GetVersion("ctx", 1);
  assert(first.metadata().at("change_type") == "create");
  assert(first.metadata().at("diff") == "+a +b");
  assert(first.metadata().at("fields_added") == "2");

  auto second = store.GetVersion("ctx", 2);
  assert(second.metadata().at("change_type") == "update");
  assert(second.metadata().at("diff") == "~a -b +c");
  assert(second.metadata().at("fields_added") == "1");
  assert(second.metadata().at("fields_changed") == "1");
  assert(second.metadata().at("fields_removed") == "1");
}

void TestRetentionKeepsNewestVersions() {
  auto store = NewStore(NewRepo(), 3);

  for (int i = 1; i <= 8; ++i) {
    store.Commit("ctx", PayloadFromJson(R"({"n":)" + std::to_string(i) + "}"), SOURCE_SYSTEM_A);
  }

  auto versions = store.ListVersions("ctx", 100);
  assert(versions.size() == 3);
  assert(versions.front().version_number() == 8);
  assert(versions.back().version_number() == 6);
  assert(store.GetCurrent("ctx").current_version() == 8);

  bool threw = false;
  try {
    (void)store.GetVersion("ctx", 5);
  } catch (const ctxsync::util::NotFoundError&) {
    threw = true;
  }
  assert(threw && "pruned versions are gone");
  assert(store.Stats().pruned_versions == 5);
}

void TestOversizePayloadIsRejectedBeforeWriting() {
  auto store = NewStore(NewRepo(), 100, 16);

  bool threw = false;
  try {
    store.Commit("ctx", PayloadFromJson(R"({"text":"this payload is far larger than sixteen bytes"})"), SOURCE_SYSTEM_A);
  } catch (const ctxsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!store.FindCurrent("ctx").has_value());
}

void TestInvalidCommits() {
  auto store = NewStore(NewRepo());

  bool threw = false;
  try {
    store.Commit("", PayloadFromJson("{}"), SOURCE_SYSTEM_A);
  } catch (const ctxsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  CommitOptions opts;
  opts.create_if_missing = false;
  threw                  = false;
  try {
    store.Commit("missing", PayloadFromJson("{}"), SOURCE_SYSTEM_A, opts);
  } catch (const ctxsync::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);

  auto locks = store.LockContexts({"other"});
  threw      = false;
  try {
    store.Commit(locks, "ctx", PayloadFromJson("{}"), SOURCE_SYSTEM_A);
  } catch (const ctxsync::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "committing requires the context lock");
}

void TestListVersionsCursor() {
  auto store = NewStore(NewRepo());
  for (int i = 1; i <= 5; ++i) {
    store.Commit("ctx", PayloadFromJson(R"({"n":)" + std::to_string(i) + "}"), SOURCE_SYSTEM_A);
  }

  auto page = store.ListVersions("ctx", 2);
  assert(page.size() == 2 && page[0].version_number() == 5 && page[1].version_number() == 4);

  page = store.ListVersions("ctx", 2, page.back().version_number());
  assert(page.size() == 2 && page[0].version_number() == 3 && page[1].version_number() == 2);

  page = store.ListVersions("ctx", 2, 2);
  assert(page.size() == 1 && page[0].version_number() == 1);

  bool threw = false;
  try {
    (void)store.ListVersions("nope", 10);
  } catch (const ctxsync::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);
}

void TestRestoreSnapshotRewindsHistory() {
  auto store = NewStore(NewRepo());
  store.Commit("existing", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);

  auto snapshot = store.CreateSnapshot({"existing", "fresh"});
  {
    auto locks = store.LockContexts({"existing", "fresh"});
    store.Commit(locks, "existing", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_B);
    store.Commit(locks, "existing", PayloadFromJson(R"({"v":3})"), SOURCE_SYSTEM_B);
    store.Commit(locks, "fresh", PayloadFromJson(R"({"new":true})"), SOURCE_SYSTEM_B);
  }

  store.RestoreSnapshot(snapshot);
  assert(snapshot.Finished());

  auto current = store.GetCurrent("existing");
  assert(current.current_version() == 1);
  assert(current.source_system() == SOURCE_SYSTEM_A);
  assert(current.payload().fields().at("v").number_value() == 1);
  assert(store.ListVersions("existing", 10).size() == 1);
  assert(!store.FindCurrent("fresh").has_value());

  // Numbering resumes after the restored version.
  assert(store.Commit("existing", PayloadFromJson(R"({"v":4})"), SOURCE_SYSTEM_A) == 2);
}

void TestPinnedContextsDeferPruning() {
  auto store = NewStore(NewRepo(), 2);
  store.Commit("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);
  store.Commit("ctx", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_A);

  auto snapshot = store.CreateSnapshot({"ctx"});
  for (int i = 3; i <= 5; ++i) {
    store.Commit("ctx", PayloadFromJson(R"({"v":)" + std::to_string(i) + "}"), SOURCE_SYSTEM_A);
  }
  assert(store.ListVersions("ctx", 10).size() == 5);

  store.RestoreSnapshot(snapshot);
  auto versions = store.ListVersions("ctx", 10);
  assert(versions.size() == 2);
  assert(versions.front().version_number() == 2);
  assert(store.GetCurrent("ctx").payload().fields().at("v").number_value() == 2);

  auto second = store.CreateSnapshot({"ctx"});
  store.Commit("ctx", PayloadFromJson(R"({"v":9})"), SOURCE_SYSTEM_A);
  store.Commit("ctx", PayloadFromJson(R"({"v":10})"), SOURCE_SYSTEM_A);
  assert(store.ListVersions("ctx", 10).size() == 4);
  store.DiscardSnapshot(second);
  assert(store.ListVersions("ctx", 10).size() == 2);
  assert(store.GetCurrent("ctx").current_version() == 4);
}

void TestCasConflictIsRetriedOnce() {
  auto inner = NewRepo();
  {
    auto seed = NewStore(inner);
    seed.Commit("ctx", PayloadFromJson(R"({"v":1})"), SOURCE_SYSTEM_A);
  }

  auto once = NewStore(std::make_shared<ConflictingRepository>(inner, 1));
  assert(once.Commit("ctx", PayloadFromJson(R"({"v":2})"), SOURCE_SYSTEM_A) == 2);
  assert(once.Stats().conflict_retries == 1);

  auto twice = NewStore(std::make_shared<ConflictingRepository>(inner, 2));
  bool threw = false;
  try {
    twice.Commit("ctx", PayloadFromJson(R"({"v":3})"), SOURCE_SYSTEM_A);
  } catch (const ctxsync::util::ConflictCommitError&) {
    threw = true;
  }
  assert(threw);
  assert(twice.GetCurrent("ctx").current_version() == 2);
}

void TestConcurrentCommitsGetDistinctVersions() {
  auto store = NewStore(NewRepo(), 1000);

  constexpr int kThreads    = 8;
  constexpr int kPerThread  = 25;
  std::vector<std::thread> threads;
  std::vector<std::vector<uint64_t>> seen(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        seen[t].push_back(store.Commit("shared", PayloadFromJson(R"({"t":)" + std::to_string(t) + "}"), SOURCE_SYSTEM_A));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  std::set<uint64_t> all;
  for (const auto& per_thread : seen) {
    for (std::size_t i = 1; i < per_thread.size(); ++i) {
      assert(per_thread[i] > per_thread[i - 1]);
    }
    all.insert(per_thread.begin(), per_thread.end());
  }
  assert(all.size() == kThreads * kPerThread);
  assert(*all.rbegin() == kThreads * kPerThread);
}

void TestStatsAndPruneAll() {
  auto repo = NewRepo();
  {
    auto wide = NewStore(repo, 10);
    for (int i = 0; i < 6; ++i) {
      wide.Commit("a", PayloadFromJson(R"({"i":)" + std::to_string(i) + "}"), SOURCE_SYSTEM_A);
    }
    wide.Commit("b", PayloadFromJson("{}"), SOURCE_SYSTEM_B);
  }

  auto narrow = NewStore(repo, 2);
  assert(narrow.PruneAll() == 4);

  auto stats = narrow.Stats();
  assert(stats.contexts == 2);
  assert(stats.versions == 3);
  assert(stats.avg_versions_per_context == 1.5);
  assert((narrow.ListContextIds() == std::vector<std::string>{"a", "b"}));
}

} // namespace

int main() {
  TestVersionsIncreaseAndCarryMetadata();
  TestRetentionKeepsNewestVersions();
  TestOversizePayloadIsRejectedBeforeWriting();
  TestInvalidCommits();
  TestListVersionsCursor();
  TestRestoreSnapshotRewindsHistory();
  TestPinnedContextsDeferPruning();
  TestCasConflictIsRetriedOnce();
  TestConcurrentCommitsGetDistinctVersions();
  TestStatsAndPruneAll();

  std::cout << "ctxsync_unit_version_store: pass\n";
  return 0;
}
