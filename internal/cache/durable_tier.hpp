#pragma once

#include <chrono>
#include <memory>

#include "internal/cache/tier_store.hpp"
#include "internal/db/api/repository.hpp"

namespace ctxsync::cache {

/*
  L3: cache_entry table in the repository database.
  Expired rows read as misses until the sweeper deletes them.
*/
class DurableTier final : public TierStore {
 public:
  struct Options {
    std::chrono::milliseconds ttl{std::chrono::hours(24)};
  };

  DurableTier(std::shared_ptr<db::Repository> repository, Options options);

  std::optional<v1::Context> Get(const std::string& key) override;
  void                       Set(const std::string& key, const v1::Context& value) override;
  void                       Delete(const std::string& key) override;
  uint64_t                   Size() override;
  uint64_t                   PurgeExpired() override;

 private:
  std::shared_ptr<db::Repository> repository_;
  Options                         options_;
};

} // namespace ctxsync::cache
