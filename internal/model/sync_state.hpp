#pragma once

#include <cstdint>
#include <string_view>

namespace ctxsync::model {

enum class SyncState : std::uint8_t {
  kIdle         = 0,
  kSnapshotting = 1,
  kFetching     = 2,
  kMerging      = 3,
  kCommitting   = 4,
  kIndexing     = 5,
  kRollingBack  = 6,
};

constexpr std::string_view ToString(SyncState state) {
  switch (state) {
    case SyncState::kIdle:
      return "idle";
    case SyncState::kSnapshotting:
      return "snapshotting";
    case SyncState::kFetching:
      return "fetching";
    case SyncState::kMerging:
      return "merging";
    case SyncState::kCommitting:
      return "committing";
    case SyncState::kIndexing:
      return "indexing";
    case SyncState::kRollingBack:
    default:
      return "rolling_back";
  }
}

/*
  Idle -> Snapshotting -> Fetching -> Merging -> Committing -> Indexing -> Idle

  Nothing to commit goes Merging -> Idle. Commit failures go to
  RollingBack. Indexing failures never roll back.
*/
constexpr bool CanTransition(SyncState from, SyncState to) {
  switch (from) {
    case SyncState::kIdle:
      return to == SyncState::kSnapshotting;
    case SyncState::kSnapshotting:
      return to == SyncState::kFetching || to == SyncState::kIdle;
    case SyncState::kFetching:
      return to == SyncState::kMerging || to == SyncState::kRollingBack;
    case SyncState::kMerging:
      return to == SyncState::kCommitting || to == SyncState::kIdle || to == SyncState::kRollingBack;
    case SyncState::kCommitting:
      return to == SyncState::kIndexing || to == SyncState::kRollingBack;
    case SyncState::kIndexing:
      return to == SyncState::kIdle;
    case SyncState::kRollingBack:
      return to == SyncState::kIdle;
  }
  return false;
}

enum class SyncOutcome : std::uint8_t {
  kCommitted           = 0,
  kRolledBack          = 1,
  kPartialIndexFailure = 2,
  kAborted             = 3,
};

constexpr std::string_view ToString(SyncOutcome outcome) {
  switch (outcome) {
    case SyncOutcome::kCommitted:
      return "committed";
    case SyncOutcome::kRolledBack:
      return "rolled_back";
    case SyncOutcome::kPartialIndexFailure:
      return "partial_index_failure";
    case SyncOutcome::kAborted:
    default:
      return "aborted";
  }
}

} // namespace ctxsync::model
