#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctxsync/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/payload.hpp"

namespace ctxsync::version {

/*
  Holds the per-context serialization points for a set of ids, acquired
  in sorted order. Movable, released on destruction.
*/
class ContextLocks {
 public:
  ContextLocks()                               = default;
  ContextLocks(ContextLocks&&)                 = default;
  ContextLocks& operator=(ContextLocks&&)      = default;
  ContextLocks(const ContextLocks&)            = delete;
  ContextLocks& operator=(const ContextLocks&) = delete;

  const std::vector<std::string>& Ids() const {
    return ids_;
  }
  bool Holds(const std::string& id) const;

 private:
  friend class VersionStore;

  std::vector<std::string>                  ids_;
  std::vector<std::shared_ptr<std::mutex>>  mutexes_;
  std::vector<std::unique_lock<std::mutex>> locks_;
};

/*
  State of a set of contexts captured at the start of a sync pass.
  While the snapshot is live its contexts are pinned: retention pruning
  is deferred so a restore can always reach the recorded version.
*/
class SyncSnapshot {
 public:
  struct Entry {
    bool                 existed = false;
    db::model::ContextRecord record;
  };

  const std::map<std::string, Entry>& Entries() const {
    return entries_;
  }
  std::vector<std::string> ContextIds() const;
  bool                     Finished() const {
    return finished_;
  }

 private:
  friend class VersionStore;

  std::map<std::string, Entry> entries_;
  bool                         finished_ = false;
};

struct CommitOptions {
  bool create_if_missing = true;

  // "create" or "update" when empty.
  std::string change_type;

  // Kept from the previous row when empty.
  std::string parent_id;

  std::map<std::string, std::string> extra_metadata;
};

struct VersionStoreStats {
  uint64_t contexts                 = 0;
  uint64_t versions                 = 0;
  double   avg_versions_per_context = 0.0;
  uint64_t commits                  = 0;
  uint64_t conflict_retries         = 0;
  uint64_t pruned_versions          = 0;
};

class VersionStore {
 public:
  struct Options {
    uint32_t retention         = 100;
    uint64_t max_payload_bytes = 10 * 1024 * 1024;
  };

  VersionStore(std::shared_ptr<db::Repository> repository, Options options);

  const Options& GetOptions() const {
    return options_;
  }

  // Writes ------------------------------------------------------------

  uint64_t Commit(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source, const CommitOptions& options = {});

  // Caller already holds the context's lock (sync passes).
  uint64_t Commit(const ContextLocks& locks, const std::string& context_id, const util::Payload& payload, v1::SourceSystem source,
                  const CommitOptions& options = {});

  ContextLocks LockContexts(std::vector<std::string> context_ids);

  // Reads -------------------------------------------------------------

  v1::Context                     GetCurrent(const std::string& context_id);
  std::optional<v1::Context>      FindCurrent(const std::string& context_id);
  v1::ContextVersion              GetVersion(const std::string& context_id, uint64_t version_number);
  std::vector<v1::ContextVersion> ListVersions(const std::string& context_id, uint64_t limit, std::optional<uint64_t> before_version = std::nullopt);
  std::vector<std::string>        ListContextIds();

  // Snapshots (sync engine only) ----------------------------------------

  SyncSnapshot CreateSnapshot(const std::vector<std::string>& context_ids);

  // Re-records entries whose contexts moved since the snapshot was taken.
  // Returns the ids that moved.
  std::vector<std::string> RefreshSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks);

  void RestoreSnapshot(SyncSnapshot& snapshot);
  void RestoreSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks);
  void DiscardSnapshot(SyncSnapshot& snapshot);
  void DiscardSnapshot(SyncSnapshot& snapshot, const ContextLocks& locks);

  // Maintenance ---------------------------------------------------------

  uint64_t          PruneAll();
  VersionStoreStats Stats();

 private:
  std::shared_ptr<std::mutex> ContextMutex(const std::string& context_id);

  std::optional<uint64_t> TryCommit(const std::string& context_id, const util::Payload& payload, v1::SourceSystem source, const CommitOptions& options);

  void     RequireHeld(const ContextLocks& locks, const std::string& context_id, const char* op) const;
  bool     IsPinned(const std::string& context_id) const;
  void     Pin(const std::string& context_id);
  void     Unpin(const std::string& context_id);
  uint64_t Prune(const std::string& context_id);

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;

  std::mutex                                                    context_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> context_mutexes_;

  mutable std::mutex                        pins_mutex_;
  std::unordered_map<std::string, uint32_t> pins_;

  std::atomic<uint64_t> commits_{0};
  std::atomic<uint64_t> conflict_retries_{0};
  std::atomic<uint64_t> pruned_versions_{0};
};

} // namespace ctxsync::version
