#include "internal/cache/memory_tier.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using namespace std::chrono_literals;

using ctxsync::cache::MemoryTier;

ctxsync::v1::Context MakeContext(const std::string& id, uint64_t version) {
  ctxsync::v1::Context context;
  context.set_id(id);
  context.set_current_version(version);
  return context;
}

void TestLeastRecentlyUsedIsEvicted() {
  MemoryTier tier({3, 1h});
  tier.Set("a", MakeContext("a", 1));
  tier.Set("b", MakeContext("b", 1));
  tier.Set("c", MakeContext("c", 1));

  // Touch "a" so "b" becomes the oldest.
  assert(tier.Get("a").has_value());
  tier.Set("d", MakeContext("d", 1));

  assert(tier.Size() == 3);
  assert(!tier.Get("b").has_value());
  assert(tier.Get("a").has_value());
  assert(tier.Get("c").has_value());
  assert(tier.Get("d").has_value());
}

void TestOverwriteReplacesValueWithoutGrowing() {
  MemoryTier tier({2, 1h});
  tier.Set("a", MakeContext("a", 1));
  tier.Set("a", MakeContext("a", 2));

  assert(tier.Size() == 1);
  assert(tier.Get("a")->current_version() == 2);
}

void TestExpiredEntriesReadAsMisses() {
  MemoryTier tier({10, 20ms});
  tier.Set("a", MakeContext("a", 1));
  tier.Set("b", MakeContext("b", 1));
  assert(tier.Get("a").has_value());

  std::this_thread::sleep_for(50ms);
  assert(!tier.Get("a").has_value());
  assert(tier.Size() == 1);
  assert(tier.PurgeExpired() == 1);
  assert(tier.Size() == 0);
}

void TestDeleteAndClear() {
  MemoryTier tier({10, 1h});
  tier.Set("a", MakeContext("a", 1));
  tier.Set("b", MakeContext("b", 1));

  tier.Delete("a");
  tier.Delete("a");
  tier.Delete("missing");
  assert(!tier.Get("a").has_value());
  assert(tier.Size() == 1);

  tier.Clear();
  assert(tier.Size() == 0);
  tier.Set("c", MakeContext("c", 1));
  assert(tier.Get("c").has_value());
}

} // namespace

int main() {
  TestLeastRecentlyUsedIsEvicted();
  TestOverwriteReplacesValueWithoutGrowing();
  TestExpiredEntriesReadAsMisses();
  TestDeleteAndClear();

  std::cout << "ctxsync_unit_memory_tier: pass\n";
  return 0;
}
