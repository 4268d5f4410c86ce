#include "memory_tier.hpp"

namespace ctxsync::cache {

MemoryTier::MemoryTier(Options options) : options_(options) {
  if (options_.max_entries == 0) {
    options_.max_entries = 1;
  }
}

void MemoryTier::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru_it);
  entries_.erase(it);
}

std::optional<v1::Context> MemoryTier::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (SteadyClock::now() >= it->second.expires_at) {
    EraseLocked(it);
    return std::nullopt;
  }

  lru_.splice(lru_.begin(), lru_, it->second.lru_it);
  return it->second.value;
}

void MemoryTier::Set(const std::string& key, const v1::Context& value) {
  std::lock_guard lock(mutex_);

  const auto expires_at = SteadyClock::now() + options_.ttl;
  if (auto it = entries_.find(key); it != entries_.end()) {
    it->second.value      = value;
    it->second.expires_at = expires_at;
    lru_.splice(lru_.begin(), lru_, it->second.lru_it);
    return;
  }

  while (entries_.size() >= options_.max_entries && !lru_.empty()) {
    entries_.erase(lru_.back());
    lru_.pop_back();
  }

  lru_.push_front(key);
  entries_.emplace(key, Entry{value, lru_.begin(), expires_at});
}

void MemoryTier::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (auto it = entries_.find(key); it != entries_.end()) {
    EraseLocked(it);
  }
}

uint64_t MemoryTier::Size() {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

uint64_t MemoryTier::PurgeExpired() {
  std::lock_guard lock(mutex_);

  const auto now     = SteadyClock::now();
  uint64_t   removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now < it->second.expires_at) {
      ++it;
      continue;
    }
    lru_.erase(it->second.lru_it);
    it = entries_.erase(it);
    ++removed;
  }
  return removed;
}

void MemoryTier::Clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
  lru_.clear();
}

} // namespace ctxsync::cache
