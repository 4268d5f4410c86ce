#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "internal/cache/memory_tier.hpp"
#include "internal/cache/tier_store.hpp"
#include "internal/model/cache_tier.hpp"

namespace ctxsync::cache {

struct TierStats {
  bool     enabled  = false;
  uint64_t hits     = 0;
  uint64_t misses   = 0;
  uint64_t errors   = 0;
  uint64_t size     = 0;
  double   hit_rate = 0.0;
};

struct CacheMetrics {
  std::array<TierStats, model::kCacheTierCount> tiers{};

  uint64_t requests        = 0;
  uint64_t hits            = 0;
  uint64_t misses          = 0;
  double   hit_rate        = 0.0;
  double   target_hit_rate = 0.85;
  bool     meets_target    = false;
};

/*
  Three-level read-through cache in front of the VersionStore.

  Lookups probe L1 -> L2 -> L3 and promote hits into every faster tier.
  Promotion is generation-checked like a fill, so a value read before an
  Invalidate never lands back in a faster tier.
  L2 and L3 are optional; their failures count as a miss at that tier and
  are never thrown to callers.

  Fills after a full miss are generation-checked: a value read before an
  Invalidate of the same key is dropped instead of cached.
*/
class TierCache {
 public:
  struct Options {
    double                    target_hit_rate = 0.85;
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
  };

  using Loader = std::function<std::optional<v1::Context>(const std::string& key)>;

  TierCache(std::shared_ptr<MemoryTier> l1, std::shared_ptr<TierStore> l2, std::shared_ptr<TierStore> l3, Options options);
  ~TierCache();

  TierCache(const TierCache&)            = delete;
  TierCache& operator=(const TierCache&) = delete;

  std::optional<v1::Context> Get(const std::string& key);

  // Writes the named tier and every faster one.
  void Set(const std::string& key, const v1::Context& value, model::CacheTier tier = model::CacheTier::kL1);

  void Invalidate(const std::string& key);

  // Token for a later Fill of the same key.
  uint64_t BeginFill(const std::string& key);

  // Returns false when the key was invalidated since BeginFill.
  bool Fill(const std::string& key, uint64_t token, const v1::Context& value, model::CacheTier tier = model::CacheTier::kL1);

  // Loads keys into the faster tiers from the slowest tier holding them,
  // falling back to loader. Hit/miss counters are untouched.
  uint64_t Warm(const std::vector<std::string>& keys, const Loader& loader = {});

  CacheMetrics Metrics();

  bool Enabled(model::CacheTier tier) const {
    return Store(tier) != nullptr;
  }

  // Slowest configured tier; fills write from here upward.
  model::CacheTier FillTier() const;

  void Start();
  void Stop();

  // One expiry sweep; the background loop calls this every sweep_interval.
  void SweepOnce();

  // Drops all L1 entries.
  void Drain();

  static std::string VersionKey(const std::string& context_id, uint64_t version);

 private:
  struct Counters {
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> errors{0};
  };

  static constexpr std::size_t kFillStripes = 16;

  TierStore* Store(model::CacheTier tier) const;

  std::optional<v1::Context> Probe(model::CacheTier tier, const std::string& key, bool count);
  void                       Write(model::CacheTier tier, const std::string& key, const v1::Context& value);
  void                       Erase(model::CacheTier tier, const std::string& key);
  bool                       Promote(const std::string& key, uint64_t token, const v1::Context& value, model::CacheTier source);
  void                       RecordError(model::CacheTier tier, const char* op, const std::string& key, const std::exception& e);

  std::mutex& Stripe(const std::string& key);
  uint64_t    GenerationLocked(const std::string& key) const;

  void Loop();

  std::shared_ptr<MemoryTier> l1_;
  std::shared_ptr<TierStore>  l2_;
  std::shared_ptr<TierStore>  l3_;
  Options                     options_;

  std::array<Counters, model::kCacheTierCount> counters_;
  std::atomic<uint64_t>                        requests_{0};
  std::atomic<uint64_t>                        hits_{0};

  std::array<std::mutex, kFillStripes>      fill_stripes_;
  mutable std::mutex                        generations_mutex_;
  std::unordered_map<std::string, uint64_t> generations_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace ctxsync::cache
