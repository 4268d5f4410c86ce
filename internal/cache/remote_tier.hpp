#pragma once

#include <chrono>
#include <memory>

#include "internal/cache/tier_store.hpp"

namespace ctxsync::cache {

/*
  L2: network-attached distributed cache reached over
  ctxsync.v1.DistributedCache. Every call carries a deadline; RPC failures
  surface as grpc::RpcError.
*/
class RemoteTier final : public TierStore {
 public:
  struct Options {
    std::string               key_prefix = "ctxsync:cache:";
    std::chrono::milliseconds ttl{std::chrono::seconds(3600)};
    std::chrono::milliseconds timeout{std::chrono::milliseconds(250)};
  };

  RemoteTier(std::shared_ptr<v1::DistributedCache::StubInterface> stub, Options options);

  std::optional<v1::Context> Get(const std::string& key) override;
  void                       Set(const std::string& key, const v1::Context& value) override;
  void                       Delete(const std::string& key) override;
  uint64_t                   Size() override;

  // The remote cache expires entries on its own.
  uint64_t PurgeExpired() override {
    return 0;
  }

 private:
  std::string Key(const std::string& key) const {
    return options_.key_prefix + key;
  }

  std::shared_ptr<v1::DistributedCache::StubInterface> stub_;
  Options                                              options_;
};

} // namespace ctxsync::cache
