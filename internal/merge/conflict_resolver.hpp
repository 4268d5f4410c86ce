#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "ctxsync/v1.hpp"
#include "internal/util/payload.hpp"
#include "internal/util/time.hpp"

namespace ctxsync::merge {

/*
  Field authority: which system owns a top-level payload field when both
  changed it. A field may be owned by at most one system.
*/
struct AuthorityPolicy {
  std::set<std::string> a_authoritative;
  std::set<std::string> b_authoritative;
};

// One producer's view of a context for a sync pass.
struct SourceView {
  util::Payload   payload;
  util::TimePoint updated_at{};
};

// Whether each producer answered the fetch. A reachable producer that has
// no copy of the context still counts as reachable.
struct Reachability {
  bool a = true;
  bool b = true;
};

enum class Resolution {
  kOneSidedChange,
  kAuthority,
  kRecency,
  kTieBreak,
};

std::string_view ToString(Resolution resolution);

struct FieldConflict {
  std::string                 field;
  v1::SourceSystem            winner = v1::SOURCE_SYSTEM_UNSPECIFIED;
  Resolution                  reason = Resolution::kRecency;
  google::protobuf::Value     value_a;
  google::protobuf::Value     value_b;
};

struct ConflictReport {
  // Sorted by field name.
  std::vector<FieldConflict> conflicts;

  // Set only when a producer was unreachable or timed out. missing names
  // every system that contributed no view, reachable or not.
  bool                          partial = false;
  std::vector<v1::SourceSystem> missing;

  // "field:winner:reason" entries joined by ','.
  std::string Summary() const;
};

struct MergeResult {
  util::Payload  payload;
  ConflictReport report;
};

/*
  Three-way merge of System A and System B views over the current payload.
  Pure and deterministic.
*/
class ConflictResolver {
 public:
  // Throws util::ValidationError if a field is authoritative for both systems.
  explicit ConflictResolver(AuthorityPolicy policy);

  MergeResult Merge(const util::Payload* base, const std::optional<SourceView>& view_a, const std::optional<SourceView>& view_b,
                    Reachability reachable = {}) const;

  const AuthorityPolicy& Policy() const {
    return policy_;
  }

 private:
  AuthorityPolicy policy_;
};

// ------------------------------------------------------------
// Caller-driven merges of whole contexts
// ------------------------------------------------------------

enum class MergeStrategy {
  kUnion,
  kLatest,
  kIntersection,
};

// Throws util::ValidationError on an unknown name.
MergeStrategy    ParseMergeStrategy(std::string_view name);
std::string_view ToString(MergeStrategy strategy);

util::Payload MergeMany(const std::vector<v1::Context>& contexts, MergeStrategy strategy);

std::string_view SourceName(v1::SourceSystem source);

} // namespace ctxsync::merge
