#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ctxsync::db::memory {

/*
  Transaction = snapshot + write set

  Only rows marked dirty are published on Commit(). A dirty row whose
  committed stamp moved since Begin() fails the commit with
  TransactionConflict, so writers of disjoint contexts never collide.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Context row and its versions share one dirty marker.
  MemoryRepository::State& MutableContext(const std::string& id) {
    dirty_contexts_.insert(id);
    return working_;
  }
  MemoryRepository::State& MutableCacheEntry(const std::string& key) {
    dirty_cache_keys_.insert(key);
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&        repo_;
  MemoryRepository::State  working_;
  MemoryRepository::Stamps snapshot_stamps_;
  std::set<std::string>    dirty_contexts_;
  std::set<std::string>    dirty_cache_keys_;
  bool                     committed_   = false;
  bool                     rolled_back_ = false;
};

} // namespace ctxsync::db::memory
