#include "internal/version/version_store.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ctxsync::version {

namespace {

constexpr int kCommitAttempts = 2;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.Describe(context);
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFoundError(message);
  }
  if (db::IsWriteConflict(result.code)) {
    throw db::TransactionConflict(message);
  }
  throw std::runtime_error(message);
}

v1::Context ToContext(const db::model::ContextRecord& record) {
  v1::Context context;
  context.set_id(record.id);
  context.set_current_version(record.current_version);
  *context.mutable_payload() = util::PayloadFromJson(record.payload_json);
  context.set_source_system(static_cast<v1::SourceSystem>(record.source_system));
  *context.mutable_updated_at() = util::ToProto(util::FromUnixMillis(record.updated_at_ms));
  context.set_parent_id(record.parent_id);
  return context;
}

v1::ContextVersion ToContextVersion(const db::model::ContextVersionRecord& record) {
  v1::ContextVersion version;
  version.set_context_id(record.context_id);
  version.set_version_number(record.version);
  *version.mutable_payload() = util::PayloadFromJson(record.payload_json);
  version.set_source_system(static_cast<v1::SourceSystem>(record.source_system));
  *version.mutable_created_at() = util::ToProto(util::FromUnixMillis(record.created_at_ms));
  for (const auto& [key, value] : util::MetadataFromJson(record.metadata_json)) {
    (*version.mutable_metadata())[key] = value;
  }
  return version;
}

// "+added ~changed -removed", sorted by field name.
void DescribeChange(const util::Payload* previous, const util::Payload& next, std::map<std::string, std::string>& metadata) {
  std::set<std::string> keys;
  for (const auto& [key, _] : next.fields()) keys.insert(key);
  if (previous) {
    for (const auto& [key, _] : previous->fields()) keys.insert(key);
  }

  uint64_t           added = 0, changed = 0, removed = 0;
  std::ostringstream diff;
  for (const auto& key : keys) {
    const auto now    = next.fields().find(key);
    const bool in_new = now != next.fields().end();
    const bool in_old = previous && previous->fields().contains(key);

    char marker = 0;
    if (in_new && !in_old) {
      marker = '+';
      ++added;
    } else if (!in_new && in_old) {
      marker = '-';
      ++removed;
    } else if (!util::ValueEquals(previous->fields().at(key), now->second)) {
      marker = '~';
      ++changed;
    }
    if (marker) {
      if (diff.tellp() > 0) diff << ' ';
      diff << marker << key;
    }
  }

  metadata["diff"]           = diff.str();
  metadata["fields_added"]   = std::to_string(added);
  metadata["fields_changed"] = std::to_string(changed);
  metadata["fields_removed"] = std::to_string(removed);
}

} // namespace

// ------------------------------------------------------------
// ContextLocks / SyncSnapshot
// ------------------------------------------------------------

bool ContextLocks::Holds(const std::string& id) const {
  return std::binary_search(ids_.begin(), ids_.end(), id);
}

std::vector<std::string> SyncSnapshot::ContextIds() const {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& [id, _] : entries_) {
    ids.push_back(id);
  }
  return ids;
}

// ------------------------------------------------------------
// VersionStore
// ------------------------------------------------------------

VersionStore::VersionStore(std::shared_ptr<db::Repository> repository, Options options)
    : repository_(std::move(repository)), options_(options) {
  if (!repository_) {
    throw std::invalid_argument("VersionStore: repository is required");
  }
  if (options_.retention == 0) {
    options_.retention = 1;
  }
}

std::shared_ptr<std::mutex> VersionStore::ContextMutex(const std::string& context_id) {
  std::lock_guard<std::mutex> lock(context_mutexes_guard_);
  auto&                       context_mutex = context_mutexes_[context_id];
  if (!context_mutex) {
    context_mutex = std::make_shared<std::mutex>();
  }
  return context_mutex;
}

ContextLocks VersionStore::LockContexts(std::vector<std::string> context_ids) {
  std::sort(context_ids.begin(), context_ids.end());
  context_ids.erase(std::unique(context_ids.begin(), context_ids.end()), context_ids.end());

  ContextLocks locks;
  locks.ids_ = std::move(context_ids);
  locks.mutexes_.reserve(locks.ids_.size());
  locks.locks_.reserve(locks.ids_.size());
  for (const auto& id : locks.ids_) {
    locks.mutexes_.push_back(ContextMutex(id));
    locks.locks_.emplace_back(*locks.mutexes_.back());
  }
  return locks;
}

void VersionStore::RequireHeld(const ContextLocks& locks, const std::string& context_id, const char* op) const {
  if (!locks.Holds(context_id)) {
    throw util::InvalidState(std::string(op) + ": lock for context '" + context_id + "' is not held");
  }
}

uint64_t VersionStore::Commit(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source, const CommitOptions& options) {
  auto locks = LockContexts({context_id});
  return Commit(locks, context_id, payload, source, options);
}

uint64_t VersionStore::Commit(const ContextLocks& locks, const std::string& context_id, const util::Payload& payload, v1::SourceSystem source,
                              const CommitOptions& options) {
  if (context_id.empty()) {
    throw util::ValidationError("commit: context id must not be empty");
  }
  const auto size = util::PayloadBytes(payload);
  if (size > options_.max_payload_bytes) {
    throw util::ValidationError("commit: payload of " + std::to_string(size) + " bytes exceeds limit of " + std::to_string(options_.max_payload_bytes));
  }
  RequireHeld(locks, context_id, "commit");

  std::string last_error;
  for (int attempt = 0; attempt < kCommitAttempts; ++attempt) {
    try {
      if (auto version = TryCommit(context_id, payload, source, options)) {
        ++commits_;
        return *version;
      }
      last_error = "stored version changed during commit";
    } catch (const db::TransactionConflict& e) {
      last_error = e.what();
    }
    if (attempt + 1 < kCommitAttempts) {
      ++conflict_retries_;
      CTXSYNC_LOG_WARN("commit conflict, retrying", {observability::ContextField(context_id), observability::ErrorField(last_error)});
    }
  }

  throw util::ConflictCommitError("commit context '" + context_id + "': " + last_error);
}

std::optional<uint64_t> VersionStore::TryCommit(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source,
                                                const CommitOptions& options) {
  auto tx      = repository_->Begin();
  auto current = repository_->GetContext(*tx, context_id);
  if (!current && !options.create_if_missing) {
    throw util::NotFoundError("commit: context not found: " + context_id);
  }

  const uint64_t next   = current ? current->current_version + 1 : 1;
  const uint64_t now_ms = util::NowMs();
  const auto     json   = util::PayloadToJson(payload);

  std::map<std::string, std::string> metadata = options.extra_metadata;
  metadata["change_type"]                     = !options.change_type.empty() ? options.change_type : (current ? "update" : "create");
  if (current) {
    const auto previous = util::PayloadFromJson(current->payload_json);
    DescribeChange(&previous, payload, metadata);
  } else {
    DescribeChange(nullptr, payload, metadata);
  }

  db::model::ContextRecord record;
  record.id              = context_id;
  record.current_version = next;
  record.payload_json    = json;
  record.source_system   = static_cast<int>(source);
  record.parent_id       = !options.parent_id.empty() ? options.parent_id : (current ? current->parent_id : "");
  record.updated_at_ms   = now_ms;

  const auto written = current ? repository_->UpdateContext(*tx, record, current->current_version) : repository_->InsertContext(*tx, record);
  if (written.code == db::ErrorCode::Conflict || written.code == db::ErrorCode::AlreadyExists) {
    return std::nullopt;
  }
  ThrowIfDbError(written, "commit context");

  db::model::ContextVersionRecord version;
  version.context_id    = context_id;
  version.version       = next;
  version.payload_json  = json;
  version.source_system = static_cast<int>(source);
  version.created_at_ms = now_ms;
  version.metadata_json = util::MetadataToJson(metadata);

  const auto appended = repository_->InsertVersion(*tx, version);
  if (appended.code == db::ErrorCode::AlreadyExists) {
    return std::nullopt;
  }
  ThrowIfDbError(appended, "append version");

  uint64_t pruned = 0;
  if (!IsPinned(context_id)) {
    ThrowIfDbError(repository_->TrimVersionsToMaxCount(*tx, context_id, options_.retention, &pruned), "prune versions");
  }

  tx->Commit();
  pruned_versions_ += pruned;
  return next;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

v1::Context VersionStore::GetCurrent(const std::string& context_id) {
  auto context = FindCurrent(context_id);
  if (!context) {
    throw util::NotFoundError("context not found: " + context_id);
  }
  return std::move(*context);
}

std::optional<v1::Context> VersionStore::FindCurrent(const std::string& context_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetContext(*tx, context_id);
  tx->Commit();
  if (!record) {
    return std::nullopt;
  }
  return ToContext(*record);
}

v1::ContextVersion VersionStore::GetVersion(const std::string& context_id, uint64_t version_number) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetVersion(*tx, context_id, version_number);
  tx->Commit();
  if (!record) {
    throw util::NotFoundError("version not found: " + context_id + "@" + std::to_string(version_number));
  }
  return ToContextVersion(*record);
}

std::vector<v1::ContextVersion> VersionStore::ListVersions(const std::string& context_id, uint64_t limit, std::optional<uint64_t> before_version) {
  auto tx = repository_->Begin();
  if (!repository_->GetContext(*tx, context_id)) {
    throw util::NotFoundError("context not found: " + context_id);
  }
  auto records = repository_->ListVersions(*tx, context_id, before_version, limit);
  tx->Commit();

  std::vector<v1::ContextVersion> versions;
  versions.reserve(records.size());
  for (const auto& record : records) {
    versions.push_back(ToContextVersion(record));
  }
  return versions;
}

std::vector<std::string> VersionStore::ListContextIds() {
  auto tx  = repository_->Begin();
  auto ids = repository_->ListContextIds(*tx);
  tx->Commit();
  return ids;
}

// ------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------

bool VersionStore::IsPinned(const std::string& context_id) const {
  std::lock_guard<std::mutex> lock(pins_mutex_);
  return pins_.contains(context_id);
}

void VersionStore::Pin(const std::string& context_id) {
  std::lock_guard<std::mutex> lock(pins_mutex_);
  ++pins_[context_id];
}

void VersionStore::Unpin(const std::string& context_id) {
  std::lock_guard<std::mutex> lock(pins_mutex_);
  auto                        it = pins_.find(context_id);
  if (it != pins_.end() && --it->second == 0) {
    pins_.erase(it);
  }
}

SyncSnapshot VersionStore::CreateSnapshot(const std::vector<std::string>& context_ids) {
  auto locks = LockContexts(context_ids);

  SyncSnapshot snapshot;
  auto         tx = repository_->Begin();
  for (const auto& id : locks.Ids()) {
    SyncSnapshot::Entry entry;
    if (auto record = repository_->GetContext(*tx, id)) {
      entry.existed = true;
      entry.record  = std::move(*record);
    }
    snapshot.entries_.emplace(id, std::move(entry));
  }
  tx->Commit();

  for (const auto& id : locks.Ids()) {
    Pin(id);
  }
  return snapshot;
}

std::vector<std::string> VersionStore::RefreshSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks) {
  std::vector<std::string> moved;
  auto                     tx = repository_->Begin();
  for (auto& [id, entry] : snapshot.entries_) {
    RequireHeld(locks, id, "refresh snapshot");
    auto           record         = repository_->GetContext(*tx, id);
    const uint64_t recorded       = entry.existed ? entry.record.current_version : 0;
    const uint64_t stored_version = record ? record->current_version : 0;
    if (recorded == stored_version) {
      continue;
    }
    entry.existed = record.has_value();
    entry.record  = record ? std::move(*record) : db::model::ContextRecord{};
    moved.push_back(id);
  }
  tx->Commit();
  return moved;
}

void VersionStore::RestoreSnapshot(SyncSnapshot& snapshot) {
  auto locks = LockContexts(snapshot.ContextIds());
  RestoreSnapshot(snapshot, locks);
}

void VersionStore::RestoreSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks) {
  if (snapshot.finished_) {
    throw util::InvalidState("restore snapshot: snapshot already finished");
  }

  auto tx = repository_->Begin();
  for (const auto& [id, entry] : snapshot.entries_) {
    RequireHeld(locks, id, "restore snapshot");
    auto current = repository_->GetContext(*tx, id);

    if (!entry.existed) {
      if (current) {
        ThrowIfDbError(repository_->DeleteContext(*tx, id), "restore snapshot: delete " + id);
      }
      continue;
    }

    if (!current) {
      throw util::SyncFatalFailure("restore snapshot: context '" + id + "' disappeared during the pass");
    }
    if (current->current_version == entry.record.current_version) {
      continue;
    }
    if (!repository_->GetVersion(*tx, id, entry.record.current_version)) {
      throw util::SyncFatalFailure("restore snapshot: version " + std::to_string(entry.record.current_version) + " of '" + id + "' is gone");
    }

    ThrowIfDbError(repository_->DeleteVersionsAbove(*tx, id, entry.record.current_version), "restore snapshot: trim " + id);
    ThrowIfDbError(repository_->UpdateContext(*tx, entry.record, current->current_version), "restore snapshot: reset " + id);
  }
  tx->Commit();

  DiscardSnapshot(snapshot, locks);
}

void VersionStore::DiscardSnapshot(SyncSnapshot& snapshot) {
  auto locks = LockContexts(snapshot.ContextIds());
  DiscardSnapshot(snapshot, locks);
}

void VersionStore::DiscardSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks) {
  if (snapshot.finished_) {
    return;
  }
  snapshot.finished_ = true;

  for (const auto& [id, _] : snapshot.entries_) {
    RequireHeld(locks, id, "discard snapshot");
    Unpin(id);
  }
  // Deferred pruning.
  for (const auto& [id, _] : snapshot.entries_) {
    Prune(id);
  }
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

uint64_t VersionStore::Prune(const std::string& context_id) {
  if (IsPinned(context_id)) {
    return 0;
  }

  uint64_t removed = 0;
  auto     tx      = repository_->Begin();
  ThrowIfDbError(repository_->TrimVersionsToMaxCount(*tx, context_id, options_.retention, &removed), "prune versions");
  tx->Commit();
  pruned_versions_ += removed;
  return removed;
}

uint64_t VersionStore::PruneAll() {
  uint64_t removed = 0;
  for (const auto& id : ListContextIds()) {
    auto locks = LockContexts({id});
    removed += Prune(id);
  }
  if (removed > 0) {
    CTXSYNC_LOG_INFO("pruned context versions", {observability::UintField("removed", removed)});
  }
  return removed;
}

VersionStoreStats VersionStore::Stats() {
  VersionStoreStats stats;
  auto              tx = repository_->Begin();
  stats.contexts       = repository_->CountContexts(*tx);
  stats.versions       = repository_->CountAllVersions(*tx);
  tx->Commit();

  stats.avg_versions_per_context = stats.contexts == 0 ? 0.0 : static_cast<double>(stats.versions) / static_cast<double>(stats.contexts);
  stats.commits                  = commits_.load();
  stats.conflict_retries         = conflict_retries_.load();
  stats.pruned_versions          = pruned_versions_.load();
  return stats;
}

} // namespace ctxsync::version
