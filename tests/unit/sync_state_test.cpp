#include "internal/model/sync_state.hpp"

#include <cassert>
#include <iostream>

namespace {

using ctxsync::model::CanTransition;
using ctxsync::model::SyncOutcome;
using ctxsync::model::SyncState;

void TestHappyPathIsAllowed() {
  static_assert(CanTransition(SyncState::kIdle, SyncState::kSnapshotting));
  static_assert(CanTransition(SyncState::kSnapshotting, SyncState::kFetching));
  static_assert(CanTransition(SyncState::kFetching, SyncState::kMerging));
  static_assert(CanTransition(SyncState::kMerging, SyncState::kCommitting));
  static_assert(CanTransition(SyncState::kCommitting, SyncState::kIndexing));
  static_assert(CanTransition(SyncState::kIndexing, SyncState::kIdle));
}

void TestFailureEdges() {
  assert(CanTransition(SyncState::kSnapshotting, SyncState::kIdle));
  assert(CanTransition(SyncState::kMerging, SyncState::kIdle));
  assert(CanTransition(SyncState::kMerging, SyncState::kRollingBack));
  assert(CanTransition(SyncState::kCommitting, SyncState::kRollingBack));
  assert(CanTransition(SyncState::kRollingBack, SyncState::kIdle));

  // Indexing failures never roll back committed work.
  assert(!CanTransition(SyncState::kIndexing, SyncState::kRollingBack));
}

void TestSkippingStatesIsRejected() {
  assert(!CanTransition(SyncState::kIdle, SyncState::kCommitting));
  assert(!CanTransition(SyncState::kIdle, SyncState::kIdle));
  assert(!CanTransition(SyncState::kSnapshotting, SyncState::kMerging));
  assert(!CanTransition(SyncState::kCommitting, SyncState::kIdle));
  assert(!CanTransition(SyncState::kRollingBack, SyncState::kCommitting));
}

void TestNames() {
  assert(ToString(SyncState::kRollingBack) == "rolling_back");
  assert(ToString(SyncState::kSnapshotting) == "snapshotting");
  assert(ToString(SyncOutcome::kPartialIndexFailure) == "partial_index_failure");
  assert(ToString(SyncOutcome::kAborted) == "aborted");
}

} // namespace

int main() {
  TestHappyPathIsAllowed();
  TestFailureEdges();
  TestSkippingStatesIsRejected();
  TestNames();

  std::cout << "ctxsync_unit_sync_state: pass\n";
  return 0;
}
