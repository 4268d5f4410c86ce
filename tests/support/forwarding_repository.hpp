#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ctxsync::testing {

/*
  Repository that forwards to another one. Tests override single methods
  to inject failures or observe calls.
*/
class ForwardingRepository : public db::Repository {
 public:
  explicit ForwardingRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertContext(db::Transaction& tx, const db::model::ContextRecord& r) override {
    return inner_->InsertContext(tx, r);
  }
  std::optional<db::model::ContextRecord> GetContext(db::Transaction& tx, const std::string& id) override {
    return inner_->GetContext(tx, id);
  }
  db::Result UpdateContext(db::Transaction& tx, const db::model::ContextRecord& r, uint64_t expected_version) override {
    return inner_->UpdateContext(tx, r, expected_version);
  }
  db::Result DeleteContext(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteContext(tx, id);
  }
  std::vector<std::string> ListContextIds(db::Transaction& tx) override {
    return inner_->ListContextIds(tx);
  }
  uint64_t CountContexts(db::Transaction& tx) override {
    return inner_->CountContexts(tx);
  }

  db::Result InsertVersion(db::Transaction& tx, const db::model::ContextVersionRecord& r) override {
    return inner_->InsertVersion(tx, r);
  }
  std::optional<db::model::ContextVersionRecord> GetVersion(db::Transaction& tx, const std::string& id, uint64_t version) override {
    return inner_->GetVersion(tx, id, version);
  }
  std::vector<db::model::ContextVersionRecord> ListVersions(db::Transaction& tx, const std::string& id, std::optional<uint64_t> before,
                                                            uint64_t limit) override {
    return inner_->ListVersions(tx, id, before, limit);
  }
  uint64_t CountVersions(db::Transaction& tx, const std::string& id) override {
    return inner_->CountVersions(tx, id);
  }
  uint64_t CountAllVersions(db::Transaction& tx) override {
    return inner_->CountAllVersions(tx);
  }
  db::Result DeleteVersionsAbove(db::Transaction& tx, const std::string& id, uint64_t max_version) override {
    return inner_->DeleteVersionsAbove(tx, id, max_version);
  }
  db::Result TrimVersionsToMaxCount(db::Transaction& tx, const std::string& id, uint64_t max_versions, uint64_t* removed) override {
    return inner_->TrimVersionsToMaxCount(tx, id, max_versions, removed);
  }

  db::Result UpsertCacheEntry(db::Transaction& tx, const db::model::CacheEntryRecord& r) override {
    return inner_->UpsertCacheEntry(tx, r);
  }
  std::optional<db::model::CacheEntryRecord> GetCacheEntry(db::Transaction& tx, const std::string& key) override {
    return inner_->GetCacheEntry(tx, key);
  }
  db::Result DeleteCacheEntry(db::Transaction& tx, const std::string& key) override {
    return inner_->DeleteCacheEntry(tx, key);
  }
  db::Result DeleteExpiredCacheEntries(db::Transaction& tx, uint64_t now_ms, uint64_t* removed) override {
    return inner_->DeleteExpiredCacheEntries(tx, now_ms, removed);
  }
  uint64_t CountCacheEntries(db::Transaction& tx) override {
    return inner_->CountCacheEntries(tx);
  }

 protected:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace ctxsync::testing
