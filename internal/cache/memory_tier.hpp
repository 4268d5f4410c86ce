#pragma once

#include <chrono>
#include <list>
#include <mutex>
#include <unordered_map>

#include "internal/cache/tier_store.hpp"

namespace ctxsync::cache {

/*
  L1: process-local LRU with a fixed TTL per entry.
*/
class MemoryTier final : public TierStore {
 public:
  struct Options {
    uint64_t                  max_entries = 10000;
    std::chrono::milliseconds ttl{std::chrono::seconds(300)};
  };

  explicit MemoryTier(Options options);

  std::optional<v1::Context> Get(const std::string& key) override;
  void                       Set(const std::string& key, const v1::Context& value) override;
  void                       Delete(const std::string& key) override;
  uint64_t                   Size() override;
  uint64_t                   PurgeExpired() override;

  // Drops every entry; used at shutdown.
  void Clear();

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct Entry {
    v1::Context                      value;
    std::list<std::string>::iterator lru_it;
    SteadyClock::time_point          expires_at;
  };

  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  Options options_;

  std::mutex                             mutex_;
  std::list<std::string>                 lru_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace ctxsync::cache
