#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/tier_cache.hpp"
#include "internal/core/context_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/index/vector_indexer.hpp"
#include "internal/merge/conflict_resolver.hpp"
#include "internal/producer/context_producer.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/version/version_store.hpp"

namespace ctxsync::factory {

/*
  Application

  Owns every long-lived component. indexer and sync are null when their
  config sections are disabled.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<version::VersionStore>   versions;
  std::shared_ptr<cache::TierCache>        cache;
  std::shared_ptr<merge::ConflictResolver> resolver;
  std::shared_ptr<index::VectorIndexer>    indexer;
  std::shared_ptr<sync::SyncEngine>        sync;
  std::shared_ptr<core::ContextManager>    manager;

  // Cache sweeper first, then the sync loop; Stop reverses the order.
  void Start();
  void Stop();
};

/*
  External collaborators. Any member left null is built as a gRPC client
  from the endpoint in the config.
*/
struct Collaborators {
  std::shared_ptr<producer::ContextProducer> system_a;
  std::shared_ptr<producer::ContextProducer> system_b;
  std::shared_ptr<cache::TierStore>          l2;
  std::shared_ptr<index::Embedder>           embedder;
  std::shared_ptr<index::VectorStore>        vector_store;
};

/*
  Build

  Composition root. The only place that knows concrete backend types.
  Throws util::ValidationError for configurations it cannot build.
*/
Application Build(const ctxsync::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

std::shared_ptr<db::Repository> BuildRepository(const ctxsync::runtime::config::RuntimeConfig& config);

} // namespace ctxsync::factory
