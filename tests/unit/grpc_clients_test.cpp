#include <grpcpp/grpcpp.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "ctxsync/v1.hpp"
#include "internal/cache/remote_tier.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/index/vector_clients.hpp"
#include "internal/producer/context_producer.hpp"

namespace {

using namespace std::chrono_literals;

namespace v1 = ctxsync::v1;

class ProducerService final : public v1::ContextProducer::Service {
 public:
  ::grpc::Status FetchCurrent(::grpc::ServerContext*, const v1::FetchCurrentRequest* req, v1::FetchCurrentResponse* resp) override {
    if (req->context_id() == "slow") {
      std::this_thread::sleep_for(300ms);
    }
    if (req->context_id() == "broken") {
      return ::grpc::Status(::grpc::StatusCode::UNAVAILABLE, "producer restarting");
    }
    if (req->context_id() != "ctx-1") {
      return ::grpc::Status::OK;
    }
    resp->set_found(true);
    (*resp->mutable_payload()->mutable_fields())["owner"].set_string_value("ann");
    resp->set_source_version("r42");
    resp->mutable_updated_at()->set_seconds(1700000000);
    return ::grpc::Status::OK;
  }
};

class CacheService final : public v1::DistributedCache::Service {
 public:
  ::grpc::Status Get(::grpc::ServerContext*, const v1::CacheGetRequest* req, v1::CacheGetResponse* resp) override {
    std::lock_guard lock(mutex_);
    auto it = values_.find(req->key());
    if (it != values_.end()) {
      resp->set_found(true);
      resp->set_value(it->second);
    }
    return ::grpc::Status::OK;
  }
  ::grpc::Status Set(::grpc::ServerContext*, const v1::CacheSetRequest* req, v1::CacheSetResponse*) override {
    std::lock_guard lock(mutex_);
    values_[req->key()] = req->value();
    last_ttl_seconds    = req->ttl().seconds();
    return ::grpc::Status::OK;
  }
  ::grpc::Status Delete(::grpc::ServerContext*, const v1::CacheDeleteRequest* req, v1::CacheDeleteResponse* resp) override {
    std::lock_guard lock(mutex_);
    resp->set_deleted(values_.erase(req->key()) > 0);
    return ::grpc::Status::OK;
  }
  ::grpc::Status Size(::grpc::ServerContext*, const v1::CacheSizeRequest* req, v1::CacheSizeResponse* resp) override {
    std::lock_guard lock(mutex_);
    uint64_t n = 0;
    for (const auto& [key, _] : values_) {
      if (key.rfind(req->key_prefix(), 0) == 0) ++n;
    }
    resp->set_entries(n);
    return ::grpc::Status::OK;
  }

  bool Has(const std::string& key) {
    std::lock_guard lock(mutex_);
    return values_.contains(key);
  }

  int64_t last_ttl_seconds = 0;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> values_;
};

class EmbedderService final : public v1::Embedder::Service {
 public:
  ::grpc::Status Embed(::grpc::ServerContext*, const v1::EmbedRequest* req, v1::EmbedResponse* resp) override {
    for (const auto& text : req->texts()) {
      auto* embedding = resp->add_embeddings();
      embedding->add_values(static_cast<float>(text.size()));
      embedding->add_values(0.5f);
    }
    return ::grpc::Status::OK;
  }
};

class VectorStoreService final : public v1::VectorStore::Service {
 public:
  ::grpc::Status Upsert(::grpc::ServerContext*, const v1::UpsertRequest* req, v1::UpsertResponse* resp) override {
    for (const auto& entry : req->entries()) {
      entries_[entry.context_id()] = entry;
    }
    resp->set_upserted(static_cast<uint32_t>(req->entries_size()));
    return ::grpc::Status::OK;
  }
  ::grpc::Status Query(::grpc::ServerContext*, const v1::QueryRequest* req, v1::QueryResponse* resp) override {
    if (req->embedding().values_size() == 0) {
      return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "empty embedding");
    }
    for (const auto& [id, entry] : entries_) {
      if (resp->matches_size() == static_cast<int>(req->limit())) break;
      auto* match = resp->add_matches();
      match->set_context_id(id);
      match->set_score(req->threshold() + 0.1f);
    }
    return ::grpc::Status::OK;
  }

  std::map<std::string, v1::VectorEntry> entries_;
};

struct InProcessServer {
  InProcessServer() {
    ::grpc::ServerBuilder builder;
    builder.RegisterService(&producer);
    builder.RegisterService(&cache);
    builder.RegisterService(&embedder);
    builder.RegisterService(&vectors);
    server  = builder.BuildAndStart();
    channel = server->InProcessChannel(::grpc::ChannelArguments());
  }

  ~InProcessServer() {
    server->Shutdown();
  }

  ProducerService                  producer;
  CacheService                     cache;
  EmbedderService                  embedder;
  VectorStoreService               vectors;
  std::unique_ptr<::grpc::Server>  server;
  std::shared_ptr<::grpc::Channel> channel;
};

void TestProducerFetch(InProcessServer& env) {
  ctxsync::producer::GrpcContextProducer producer(
      std::shared_ptr<v1::ContextProducer::StubInterface>(v1::ContextProducer::NewStub(env.channel)));

  auto found = producer.FetchCurrent("ctx-1", 1s);
  assert(found.has_value());
  assert(found->payload.fields().at("owner").string_value() == "ann");
  assert(found->source_version == "r42");
  assert(ctxsync::util::ToUnixMillis(found->updated_at) == 1700000000000ULL);

  assert(!producer.FetchCurrent("unknown", 1s).has_value());

  bool unavailable = false;
  try {
    (void)producer.FetchCurrent("broken", 1s);
  } catch (const ctxsync::grpc::RpcError& e) {
    unavailable = e.code() == ::grpc::StatusCode::UNAVAILABLE && !e.IsTimeout();
  }
  assert(unavailable);

  bool timed_out = false;
  try {
    (void)producer.FetchCurrent("slow", 50ms);
  } catch (const ctxsync::grpc::RpcError& e) {
    timed_out = e.IsTimeout();
  }
  assert(timed_out);
}

void TestRemoteTierPrefixesKeys(InProcessServer& env) {
  ctxsync::cache::RemoteTier tier(std::shared_ptr<v1::DistributedCache::StubInterface>(v1::DistributedCache::NewStub(env.channel)),
                                  {"test:", 90s, 1s});

  v1::Context context;
  context.set_id("ctx");
  context.set_current_version(5);
  tier.Set("ctx", context);

  assert(env.cache.Has("test:ctx"));
  assert(env.cache.last_ttl_seconds == 90);
  assert(tier.Get("ctx")->current_version() == 5);
  assert(!tier.Get("other").has_value());
  assert(tier.Size() == 1);

  tier.Delete("ctx");
  assert(!tier.Get("ctx").has_value());
  assert(tier.PurgeExpired() == 0);
}

void TestVectorClients(InProcessServer& env) {
  ctxsync::index::GrpcEmbedder    embedder(std::shared_ptr<v1::Embedder::StubInterface>(v1::Embedder::NewStub(env.channel)), 1s);
  ctxsync::index::GrpcVectorStore store(std::shared_ptr<v1::VectorStore::StubInterface>(v1::VectorStore::NewStub(env.channel)), 1s);

  auto embeddings = embedder.Embed({"abc", "hello"});
  assert(embeddings.size() == 2);
  assert(embeddings[1][0] == 5.0f);

  store.Upsert({{"a", embeddings[0], {{"version", "3"}}}, {"b", embeddings[1], {}}});
  assert(env.vectors.entries_.at("a").metadata().at("version") == "3");
  assert(env.vectors.entries_.at("b").embedding().values_size() == 2);

  auto matches = store.Query({1.0f, 0.0f}, 1, 0.5f);
  assert(matches.size() == 1 && matches[0].context_id == "a");

  bool rejected = false;
  try {
    (void)store.Query({}, 1, 0.5f);
  } catch (const ctxsync::grpc::RpcError& e) {
    rejected = e.code() == ::grpc::StatusCode::INVALID_ARGUMENT;
  }
  assert(rejected);
}

void TestStatusConversion() {
  ctxsync::grpc::ThrowIfRpcFailed(::grpc::Status::OK, "noop");

  bool threw = false;
  try {
    ctxsync::grpc::ThrowIfRpcFailed(::grpc::Status(::grpc::StatusCode::DEADLINE_EXCEEDED, "late"), "Op.Call");
  } catch (const ctxsync::grpc::RpcError& e) {
    threw = e.IsTimeout() && std::string(e.what()).find("Op.Call") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  InProcessServer env;
  TestProducerFetch(env);
  TestRemoteTierPrefixesKeys(env);
  TestVectorClients(env);
  TestStatusConversion();

  std::cout << "ctxsync_unit_grpc_clients: pass\n";
  return 0;
}
