#include "remote_tier.hpp"

#include <stdexcept>

#include "internal/grpc/grpc_error.hpp"

namespace ctxsync::cache {

RemoteTier::RemoteTier(std::shared_ptr<v1::DistributedCache::StubInterface> stub, Options options)
    : stub_(std::move(stub)), options_(std::move(options)) {
  if (!stub_) {
    throw std::invalid_argument("RemoteTier: stub is required");
  }
}

std::optional<v1::Context> RemoteTier::Get(const std::string& key) {
  v1::CacheGetRequest req;
  req.set_key(Key(key));

  v1::CacheGetResponse resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, options_.timeout);
  grpc::ThrowIfRpcFailed(stub_->Get(&ctx, req, &resp), "DistributedCache.Get");

  if (!resp.found()) {
    return std::nullopt;
  }

  v1::Context value;
  if (!value.ParseFromString(resp.value())) {
    throw std::runtime_error("DistributedCache.Get: undecodable value for key " + key);
  }
  return value;
}

void RemoteTier::Set(const std::string& key, const v1::Context& value) {
  v1::CacheSetRequest req;
  req.set_key(Key(key));
  if (!value.SerializeToString(req.mutable_value())) {
    throw std::runtime_error("DistributedCache.Set: cannot encode value for key " + key);
  }
  const auto ttl_ms = options_.ttl.count();
  req.mutable_ttl()->set_seconds(ttl_ms / 1000);
  req.mutable_ttl()->set_nanos(static_cast<int32_t>((ttl_ms % 1000) * 1000000));

  v1::CacheSetResponse resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, options_.timeout);
  grpc::ThrowIfRpcFailed(stub_->Set(&ctx, req, &resp), "DistributedCache.Set");
}

void RemoteTier::Delete(const std::string& key) {
  v1::CacheDeleteRequest req;
  req.set_key(Key(key));

  v1::CacheDeleteResponse resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, options_.timeout);
  grpc::ThrowIfRpcFailed(stub_->Delete(&ctx, req, &resp), "DistributedCache.Delete");
}

uint64_t RemoteTier::Size() {
  v1::CacheSizeRequest req;
  req.set_key_prefix(options_.key_prefix);

  v1::CacheSizeResponse resp;
  ::grpc::ClientContext ctx;
  grpc::SetDeadline(ctx, options_.timeout);
  grpc::ThrowIfRpcFailed(stub_->Size(&ctx, req, &resp), "DistributedCache.Size");
  return resp.entries();
}

} // namespace ctxsync::cache
