#include "durable_tier.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace ctxsync::cache {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw std::runtime_error(result.Describe(context));
  }
}

} // namespace

DurableTier::DurableTier(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("DurableTier: repository is required");
  }
}

std::optional<v1::Context> DurableTier::Get(const std::string& key) {
  auto tx  = repository_->Begin();
  auto row = repository_->GetCacheEntry(*tx, key);
  tx->Commit();

  if (!row || (row->expires_at_ms != 0 && row->expires_at_ms <= util::NowMs())) {
    return std::nullopt;
  }

  v1::Context value;
  auto        status = google::protobuf::util::JsonStringToMessage(row->value, &value);
  if (!status.ok()) {
    throw std::runtime_error("durable cache: undecodable entry '" + key + "': " + status.ToString());
  }
  return value;
}

void DurableTier::Set(const std::string& key, const v1::Context& value) {
  db::model::CacheEntryRecord row;
  row.cache_key = key;

  auto status = google::protobuf::util::MessageToJsonString(value, &row.value);
  if (!status.ok()) {
    throw std::runtime_error("durable cache: cannot encode entry '" + key + "': " + status.ToString());
  }

  row.updated_at_ms = util::NowMs();
  row.expires_at_ms = options_.ttl.count() > 0 ? row.updated_at_ms + static_cast<uint64_t>(options_.ttl.count()) : 0;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertCacheEntry(*tx, row), "durable cache: upsert " + key);
  tx->Commit();
}

void DurableTier::Delete(const std::string& key) {
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteCacheEntry(*tx, key);
  if (!result && result.code != db::ErrorCode::NotFound) {
    ThrowIfDbError(result, "durable cache: delete " + key);
  }
  tx->Commit();
}

uint64_t DurableTier::Size() {
  auto tx    = repository_->Begin();
  auto count = repository_->CountCacheEntries(*tx);
  tx->Commit();
  return count;
}

uint64_t DurableTier::PurgeExpired() {
  uint64_t removed = 0;
  auto     tx      = repository_->Begin();
  ThrowIfDbError(repository_->DeleteExpiredCacheEntries(*tx, util::NowMs(), &removed), "durable cache: purge");
  tx->Commit();
  return removed;
}

} // namespace ctxsync::cache
