#include "factory.hpp"

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/durable_tier.hpp"
#include "internal/cache/memory_tier.hpp"
#include "internal/cache/remote_tier.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if CTXSYNC_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CTXSYNC_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ctxsync::factory {

using namespace std::chrono_literals;
using ctxsync::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<::grpc::Channel> Channel(const std::string& endpoint) {
  return ::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials());
}

std::shared_ptr<cache::TierCache> BuildCache(const RuntimeConfig& config, const std::shared_ptr<db::Repository>& repository,
                                             std::shared_ptr<cache::TierStore> l2) {
  const auto& cfg = config.cache();

  cache::MemoryTier::Options l1_opts;
  l1_opts.max_entries = cfg.l1().max_entries() > 0 ? cfg.l1().max_entries() : 10000;
  l1_opts.ttl         = util::ToMillis(cfg.l1().ttl(), 300s);
  auto l1             = std::make_shared<cache::MemoryTier>(l1_opts);

  if (!l2 && cfg.l2().enabled()) {
    cache::RemoteTier::Options l2_opts;
    if (!cfg.l2().key_prefix().empty()) l2_opts.key_prefix = cfg.l2().key_prefix();
    l2_opts.ttl     = util::ToMillis(cfg.l2().ttl(), 3600s);
    l2_opts.timeout = util::ToMillis(cfg.l2().timeout(), 250ms);
    l2 = std::make_shared<cache::RemoteTier>(std::shared_ptr<v1::DistributedCache::StubInterface>(v1::DistributedCache::NewStub(Channel(cfg.l2().endpoint()))),
                                             l2_opts);
  }

  std::shared_ptr<cache::TierStore> l3;
  if (cfg.l3().enabled()) {
    cache::DurableTier::Options l3_opts;
    l3_opts.ttl = util::ToMillis(cfg.l3().ttl(), 24h);
    l3          = std::make_shared<cache::DurableTier>(repository, l3_opts);
  }

  cache::TierCache::Options options;
  options.target_hit_rate = cfg.target_hit_rate() > 0.0 ? cfg.target_hit_rate() : 0.85;
  options.sweep_interval  = util::ToMillis(cfg.l3().cleanup_interval(), 60s);
  return std::make_shared<cache::TierCache>(std::move(l1), std::move(l2), std::move(l3), options);
}

std::shared_ptr<index::VectorIndexer> BuildIndexer(const RuntimeConfig& config, Collaborators& collaborators) {
  const auto& cfg = config.index();
  if (!cfg.enabled()) {
    return nullptr;
  }

  const auto timeout = util::ToMillis(cfg.timeout(), 5s);
  if (!collaborators.embedder) {
    collaborators.embedder =
        std::make_shared<index::GrpcEmbedder>(std::shared_ptr<v1::Embedder::StubInterface>(v1::Embedder::NewStub(Channel(cfg.embedder_endpoint()))), timeout);
  }
  if (!collaborators.vector_store) {
    collaborators.vector_store = std::make_shared<index::GrpcVectorStore>(
        std::shared_ptr<v1::VectorStore::StubInterface>(v1::VectorStore::NewStub(Channel(cfg.vector_store_endpoint()))), timeout);
  }

  index::VectorIndexer::Options options;
  options.batch_size     = cfg.batch_size() > 0 ? cfg.batch_size() : 16;
  options.flush_interval = util::ToMillis(cfg.flush_interval(), 1s);
  return std::make_shared<index::VectorIndexer>(collaborators.embedder, collaborators.vector_store, options);
}

std::shared_ptr<producer::ContextProducer> BuildProducer(const std::string& endpoint) {
  return std::make_shared<producer::GrpcContextProducer>(
      std::shared_ptr<v1::ContextProducer::StubInterface>(v1::ContextProducer::NewStub(Channel(endpoint))));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CTXSYNC_DB_SQLITE
    const auto& sqlite    = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), db::sqlite::SqliteDB::Options{.wal_mode = sqlite.wal_mode()});
    sqlite_db->ApplySchema(db::sql::SqliteSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ValidationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CTXSYNC_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    pool->ApplySchema(db::sql::PostgresSchema());
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ValidationError("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const RuntimeConfig& config, Collaborators collaborators) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  version::VersionStore::Options version_opts;
  if (config.versions().retention() > 0) version_opts.retention = config.versions().retention();
  if (config.versions().max_payload_bytes() > 0) version_opts.max_payload_bytes = config.versions().max_payload_bytes();
  app.versions = std::make_shared<version::VersionStore>(app.repository, version_opts);

  app.cache = BuildCache(config, app.repository, std::move(collaborators.l2));

  // ------------------------------------------------------------------
  // Merge, index, sync
  // ------------------------------------------------------------------
  const auto&           sync_cfg = config.sync();
  merge::AuthorityPolicy policy;
  policy.a_authoritative.insert(sync_cfg.a_authoritative_fields().begin(), sync_cfg.a_authoritative_fields().end());
  policy.b_authoritative.insert(sync_cfg.b_authoritative_fields().begin(), sync_cfg.b_authoritative_fields().end());
  app.resolver = std::make_shared<merge::ConflictResolver>(std::move(policy));

  app.indexer = BuildIndexer(config, collaborators);

  if (sync_cfg.enabled()) {
    if (!collaborators.system_a) collaborators.system_a = BuildProducer(config.system_a().endpoint());
    if (!collaborators.system_b) collaborators.system_b = BuildProducer(config.system_b().endpoint());

    sync::SyncEngine::Options sync_opts;
    sync_opts.interval      = util::ToMillis(sync_cfg.interval(), 5s);
    sync_opts.fetch_timeout = util::ToMillis(sync_cfg.fetch_timeout(), 2s);
    app.sync = std::make_shared<sync::SyncEngine>(app.versions, app.cache, app.resolver, app.indexer, std::move(collaborators.system_a),
                                                  std::move(collaborators.system_b), sync_opts);
    for (const auto& id : sync_cfg.tracked_contexts()) {
      app.sync->Track(id);
    }
  }

  app.manager = std::make_shared<core::ContextManager>(app.versions, app.cache, app.indexer, app.sync);

  CTXSYNC_LOG_INFO("runtime built", {observability::BoolField("l2", app.cache->Enabled(model::CacheTier::kL2)),
                                     observability::BoolField("l3", app.cache->Enabled(model::CacheTier::kL3)),
                                     observability::BoolField("sync", app.sync != nullptr), observability::BoolField("index", app.indexer != nullptr)});
  return app;
}

void Application::Start() {
  cache->Start();
  if (indexer) {
    indexer->Start();
  }
  if (sync) {
    sync->Start();
  }
}

void Application::Stop() {
  if (sync) {
    sync->Stop();
  }
  if (indexer) {
    indexer->Stop();
  }
  if (cache) {
    cache->Stop();
  }
}

} // namespace ctxsync::factory
