#include "memory_tx.hpp"

namespace ctxsync::db::memory {

namespace {

uint64_t StampOf(const std::unordered_map<std::string, uint64_t>& stamps, const std::string& key) {
  const auto it = stamps.find(key);
  return it == stamps.end() ? 0 : it->second;
}

template <typename Map>
void Publish(Map& committed, const Map& working, const std::string& key) {
  const auto it = working.find(key);
  if (it == working.end()) {
    committed.erase(key);
  } else {
    committed[key] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_         = repo_.committed_; // snapshot copy
  snapshot_stamps_ = repo_.stamps_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : dirty_contexts_) {
    if (StampOf(repo_.stamps_.contexts, id) != StampOf(snapshot_stamps_.contexts, id)) {
      throw TransactionConflict("transaction conflict: context '" + id + "' was modified by a concurrent transaction");
    }
  }
  for (const auto& key : dirty_cache_keys_) {
    if (StampOf(repo_.stamps_.cache_entries, key) != StampOf(snapshot_stamps_.cache_entries, key)) {
      throw TransactionConflict("transaction conflict: cache entry '" + key + "' was modified by a concurrent transaction");
    }
  }

  for (const auto& id : dirty_contexts_) {
    Publish(repo_.committed_.contexts, working_.contexts, id);
    Publish(repo_.committed_.versions, working_.versions, id);
    ++repo_.stamps_.contexts[id];
  }
  for (const auto& key : dirty_cache_keys_) {
    Publish(repo_.committed_.cache_entries, working_.cache_entries, key);
    ++repo_.stamps_.cache_entries[key];
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace ctxsync::db::memory
