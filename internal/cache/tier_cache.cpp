#include "tier_cache.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ctxsync::cache {

using model::CacheTier;

namespace {

constexpr std::array<CacheTier, model::kCacheTierCount> kTiers = {CacheTier::kL1, CacheTier::kL2, CacheTier::kL3};

double Rate(uint64_t hits, uint64_t lookups) {
  return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
}

} // namespace

TierCache::TierCache(std::shared_ptr<MemoryTier> l1, std::shared_ptr<TierStore> l2, std::shared_ptr<TierStore> l3, Options options)
    : l1_(std::move(l1)), l2_(std::move(l2)), l3_(std::move(l3)), options_(options) {
  if (!l1_) {
    throw std::invalid_argument("TierCache: L1 tier is required");
  }
  if (options_.target_hit_rate <= 0.0 || options_.target_hit_rate > 1.0) {
    options_.target_hit_rate = 0.85;
  }
}

TierCache::~TierCache() {
  Stop();
}

std::string TierCache::VersionKey(const std::string& context_id, uint64_t version) {
  return context_id + "@v" + std::to_string(version);
}

TierStore* TierCache::Store(CacheTier tier) const {
  switch (tier) {
    case CacheTier::kL1:
      return l1_.get();
    case CacheTier::kL2:
      return l2_.get();
    case CacheTier::kL3:
      return l3_.get();
  }
  return nullptr;
}

void TierCache::RecordError(CacheTier tier, const char* op, const std::string& key, const std::exception& e) {
  ++counters_[model::Index(tier)].errors;
  observability::Metrics::Instance().RecordCacheError(model::ToString(tier));
  CTXSYNC_LOG_WARN("cache tier unavailable",
                   {observability::StringField("tier", model::ToString(tier)), observability::StringField("op", op),
                    observability::StringField("key", key), observability::ErrorField(e.what())});
}

CacheTier TierCache::FillTier() const {
  if (l3_) return CacheTier::kL3;
  if (l2_) return CacheTier::kL2;
  return CacheTier::kL1;
}

// ------------------------------------------------------------
// Tier primitives; backend failures are recovered here.
// ------------------------------------------------------------

std::optional<v1::Context> TierCache::Probe(CacheTier tier, const std::string& key, bool count) {
  auto* store = Store(tier);
  if (!store) {
    return std::nullopt;
  }

  std::optional<v1::Context> value;
  try {
    value = store->Get(key);
  } catch (const std::exception& e) {
    RecordError(tier, "get", key, e);
  }

  if (count) {
    auto& counters = counters_[model::Index(tier)];
    if (value) {
      ++counters.hits;
    } else {
      ++counters.misses;
    }
    observability::Metrics::Instance().RecordCacheLookup(model::ToString(tier), value.has_value());
  }
  return value;
}

void TierCache::Write(CacheTier tier, const std::string& key, const v1::Context& value) {
  auto* store = Store(tier);
  if (!store) {
    return;
  }
  try {
    store->Set(key, value);
  } catch (const std::exception& e) {
    RecordError(tier, "set", key, e);
  }
}

void TierCache::Erase(CacheTier tier, const std::string& key) {
  auto* store = Store(tier);
  if (!store) {
    return;
  }
  try {
    store->Delete(key);
  } catch (const std::exception& e) {
    RecordError(tier, "delete", key, e);
  }
}

// ------------------------------------------------------------
// Lookups
// ------------------------------------------------------------

std::optional<v1::Context> TierCache::Get(const std::string& key) {
  ++requests_;
  const auto token = BeginFill(key);

  for (const auto tier : kTiers) {
    auto value = Probe(tier, key, true);
    if (!value) {
      continue;
    }

    ++hits_;
    if (tier != CacheTier::kL1) {
      Promote(key, token, *value, tier);
    }
    return value;
  }
  return std::nullopt;
}

void TierCache::Set(const std::string& key, const v1::Context& value, CacheTier tier) {
  // Slowest first so a concurrent reader never promotes an older value over a newer one.
  for (auto it = kTiers.rbegin(); it != kTiers.rend(); ++it) {
    if (model::IsFasterOrEqual(*it, tier)) {
      Write(*it, key, value);
    }
  }
}

void TierCache::Invalidate(const std::string& key) {
  {
    std::lock_guard stripe(Stripe(key));
    std::lock_guard lock(generations_mutex_);
    ++generations_[key];
  }
  for (const auto tier : kTiers) {
    Erase(tier, key);
  }
}

// ------------------------------------------------------------
// Fill protection
// ------------------------------------------------------------

std::mutex& TierCache::Stripe(const std::string& key) {
  return fill_stripes_[std::hash<std::string>{}(key) % kFillStripes];
}

uint64_t TierCache::GenerationLocked(const std::string& key) const {
  auto it = generations_.find(key);
  return it == generations_.end() ? 0 : it->second;
}

uint64_t TierCache::BeginFill(const std::string& key) {
  std::lock_guard lock(generations_mutex_);
  return GenerationLocked(key);
}

bool TierCache::Promote(const std::string& key, uint64_t token, const v1::Context& value, CacheTier source) {
  std::lock_guard stripe(Stripe(key));
  {
    std::lock_guard lock(generations_mutex_);
    if (GenerationLocked(key) != token) {
      CTXSYNC_LOG_DEBUG("dropping stale cache promotion", {observability::StringField("key", key)});
      return false;
    }
  }
  for (const auto faster : kTiers) {
    if (faster == source) {
      break;
    }
    Write(faster, key, value);
  }
  return true;
}

bool TierCache::Fill(const std::string& key, uint64_t token, const v1::Context& value, CacheTier tier) {
  std::lock_guard stripe(Stripe(key));
  {
    std::lock_guard lock(generations_mutex_);
    if (GenerationLocked(key) != token) {
      CTXSYNC_LOG_DEBUG("dropping stale cache fill", {observability::StringField("key", key)});
      return false;
    }
  }
  Set(key, value, tier);
  return true;
}

uint64_t TierCache::Warm(const std::vector<std::string>& keys, const Loader& loader) {
  uint64_t warmed = 0;
  for (const auto& key : keys) {
    const auto                 token = BeginFill(key);
    std::optional<v1::Context> value;
    std::optional<CacheTier>   source;
    for (auto it = kTiers.rbegin(); it != kTiers.rend() && !value; ++it) {
      if (*it == CacheTier::kL1) {
        break;
      }
      if ((value = Probe(*it, key, false))) {
        source = *it;
      }
    }

    if (!value && loader) {
      value = loader(key);
    }
    if (!value) {
      continue;
    }

    const bool stored = source ? Promote(key, token, *value, *source) : Fill(key, token, *value, FillTier());
    if (stored) {
      ++warmed;
    }
  }
  return warmed;
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------

CacheMetrics TierCache::Metrics() {
  CacheMetrics m;
  for (const auto tier : kTiers) {
    auto&       stats    = m.tiers[model::Index(tier)];
    const auto& counters = counters_[model::Index(tier)];
    stats.enabled        = Enabled(tier);
    stats.hits           = counters.hits.load();
    stats.misses         = counters.misses.load();
    stats.errors         = counters.errors.load();
    stats.hit_rate       = Rate(stats.hits, stats.hits + stats.misses);
    if (stats.enabled) {
      try {
        stats.size = Store(tier)->Size();
      } catch (const std::exception& e) {
        RecordError(tier, "size", "", e);
      }
    }
  }

  m.requests        = requests_.load();
  m.hits            = hits_.load();
  m.misses          = m.requests - m.hits;
  m.hit_rate        = Rate(m.hits, m.requests);
  m.target_hit_rate = options_.target_hit_rate;
  m.meets_target    = m.hit_rate >= m.target_hit_rate;
  return m;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void TierCache::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&TierCache::Loop, this);
}

void TierCache::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    Drain();
  }
}

void TierCache::Drain() {
  l1_->Clear();
}

void TierCache::SweepOnce() {
  for (const auto tier : {CacheTier::kL1, CacheTier::kL3}) {
    auto* store = Store(tier);
    if (!store) {
      continue;
    }
    try {
      const auto removed = store->PurgeExpired();
      const auto entries = store->Size();
      observability::Metrics::Instance().SetTierEntries(model::ToString(tier), entries);
      if (removed > 0) {
        CTXSYNC_LOG_DEBUG("expired cache entries removed",
                          {observability::StringField("tier", model::ToString(tier)), observability::UintField("removed", removed)});
      }
    } catch (const std::exception& e) {
      RecordError(tier, "sweep", "", e);
    }
  }
}

void TierCache::Loop() {
  std::unique_lock lock(wake_mutex_);
  while (running_) {
    wake_.wait_for(lock, options_.sweep_interval, [this] { return !running_; });
    if (!running_) {
      break;
    }
    lock.unlock();
    SweepOnce();
    lock.lock();
  }
}

} // namespace ctxsync::cache
