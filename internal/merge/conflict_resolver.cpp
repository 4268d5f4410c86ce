#include "conflict_resolver.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace ctxsync::merge {

namespace {

const google::protobuf::Value* Field(const util::Payload* payload, const std::string& name) {
  if (!payload) {
    return nullptr;
  }
  auto it = payload->fields().find(name);
  return it == payload->fields().end() ? nullptr : &it->second;
}

void Overlay(util::Payload& target, const util::Payload& source) {
  for (const auto& [key, value] : source.fields()) {
    (*target.mutable_fields())[key] = value;
  }
}

} // namespace

std::string_view ToString(Resolution resolution) {
  switch (resolution) {
    case Resolution::kOneSidedChange:
      return "one_sided_change";
    case Resolution::kAuthority:
      return "authority";
    case Resolution::kRecency:
      return "recency";
    case Resolution::kTieBreak:
      return "tie_break";
  }
  return "unknown";
}

std::string_view SourceName(v1::SourceSystem source) {
  switch (source) {
    case v1::SOURCE_SYSTEM_A:
      return "A";
    case v1::SOURCE_SYSTEM_B:
      return "B";
    case v1::SOURCE_SYSTEM_MERGED:
      return "merged";
    default:
      return "unspecified";
  }
}

std::string ConflictReport::Summary() const {
  std::string out;
  for (const auto& c : conflicts) {
    if (!out.empty()) out += ',';
    out += c.field;
    out += ':';
    out += SourceName(c.winner);
    out += ':';
    out += ToString(c.reason);
  }
  return out;
}

// ------------------------------------------------------------
// ConflictResolver
// ------------------------------------------------------------

ConflictResolver::ConflictResolver(AuthorityPolicy policy) : policy_(std::move(policy)) {
  for (const auto& field : policy_.a_authoritative) {
    if (policy_.b_authoritative.contains(field)) {
      throw util::ValidationError("field '" + field + "' is authoritative for both systems");
    }
  }
}

MergeResult ConflictResolver::Merge(const util::Payload* base, const std::optional<SourceView>& view_a,
                                    const std::optional<SourceView>& view_b, Reachability reachable) const {
  MergeResult result;
  if (base) {
    result.payload = *base;
  }
  result.report.partial = !reachable.a || !reachable.b;

  if (!view_a || !view_b) {
    if (!view_a) result.report.missing.push_back(v1::SOURCE_SYSTEM_A);
    if (!view_b) result.report.missing.push_back(v1::SOURCE_SYSTEM_B);
    if (view_a) Overlay(result.payload, view_a->payload);
    if (view_b) Overlay(result.payload, view_b->payload);
    return result;
  }

  std::set<std::string> names;
  for (const auto& [key, _] : view_a->payload.fields()) names.insert(key);
  for (const auto& [key, _] : view_b->payload.fields()) names.insert(key);

  auto& out = *result.payload.mutable_fields();
  for (const auto& name : names) {
    const auto* a = Field(&view_a->payload, name);
    const auto* b = Field(&view_b->payload, name);

    if (!a || !b) {
      out[name] = a ? *a : *b;
      continue;
    }
    if (util::ValueEquals(*a, *b)) {
      out[name] = *a;
      continue;
    }

    FieldConflict conflict;
    conflict.field   = name;
    conflict.value_a = *a;
    conflict.value_b = *b;

    const auto* prior = Field(base, name);
    if (prior && util::ValueEquals(*prior, *a)) {
      conflict.winner = v1::SOURCE_SYSTEM_B;
      conflict.reason = Resolution::kOneSidedChange;
    } else if (prior && util::ValueEquals(*prior, *b)) {
      conflict.winner = v1::SOURCE_SYSTEM_A;
      conflict.reason = Resolution::kOneSidedChange;
    } else if (policy_.a_authoritative.contains(name)) {
      conflict.winner = v1::SOURCE_SYSTEM_A;
      conflict.reason = Resolution::kAuthority;
    } else if (policy_.b_authoritative.contains(name)) {
      conflict.winner = v1::SOURCE_SYSTEM_B;
      conflict.reason = Resolution::kAuthority;
    } else if (view_a->updated_at != view_b->updated_at) {
      conflict.winner = view_a->updated_at > view_b->updated_at ? v1::SOURCE_SYSTEM_A : v1::SOURCE_SYSTEM_B;
      conflict.reason = Resolution::kRecency;
    } else {
      conflict.winner = v1::SOURCE_SYSTEM_A;
      conflict.reason = Resolution::kTieBreak;
    }

    out[name] = conflict.winner == v1::SOURCE_SYSTEM_A ? *a : *b;
    result.report.conflicts.push_back(std::move(conflict));
  }

  // names is ordered, so conflicts already are.
  return result;
}

// ------------------------------------------------------------
// MergeMany
// ------------------------------------------------------------

MergeStrategy ParseMergeStrategy(std::string_view name) {
  if (name == "union") return MergeStrategy::kUnion;
  if (name == "latest") return MergeStrategy::kLatest;
  if (name == "intersection") return MergeStrategy::kIntersection;
  throw util::ValidationError("unknown merge strategy: " + std::string(name));
}

std::string_view ToString(MergeStrategy strategy) {
  switch (strategy) {
    case MergeStrategy::kUnion:
      return "union";
    case MergeStrategy::kLatest:
      return "latest";
    case MergeStrategy::kIntersection:
      return "intersection";
  }
  return "unknown";
}

util::Payload MergeMany(const std::vector<v1::Context>& contexts, MergeStrategy strategy) {
  util::Payload merged;
  if (contexts.empty()) {
    return merged;
  }

  switch (strategy) {
    case MergeStrategy::kUnion:
      for (const auto& context : contexts) {
        Overlay(merged, context.payload());
      }
      break;

    case MergeStrategy::kLatest: {
      const v1::Context* latest = &contexts.front();
      for (const auto& context : contexts) {
        if (util::FromProto(context.updated_at()) >= util::FromProto(latest->updated_at())) {
          latest = &context;
        }
      }
      merged = latest->payload();
      break;
    }

    case MergeStrategy::kIntersection:
      merged = contexts.front().payload();
      for (std::size_t i = 1; i < contexts.size(); ++i) {
        const auto& fields = contexts[i].payload().fields();
        for (auto it = merged.mutable_fields()->begin(); it != merged.mutable_fields()->end();) {
          if (fields.contains(it->first)) {
            ++it;
          } else {
            it = merged.mutable_fields()->erase(it);
          }
        }
      }
      break;
  }
  return merged;
}

} // namespace ctxsync::merge
