#include "internal/merge/conflict_resolver.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using ctxsync::merge::AuthorityPolicy;
using ctxsync::merge::ConflictResolver;
using ctxsync::merge::MergeStrategy;
using ctxsync::merge::Reachability;
using ctxsync::merge::Resolution;
using ctxsync::merge::SourceView;
using ctxsync::util::PayloadFromJson;

SourceView View(const std::string& json, ctxsync::util::TimePoint at) {
  return SourceView{PayloadFromJson(json), at};
}

ctxsync::v1::Context ContextAt(const std::string& json, int64_t seconds) {
  ctxsync::v1::Context context;
  *context.mutable_payload()             = PayloadFromJson(json);
  context.mutable_updated_at()->set_seconds(seconds);
  return context;
}

void TestOneSidedChangeWinsOverStaleValue() {
  ConflictResolver resolver({});
  const auto       base = PayloadFromJson(R"({"status":"open","owner":"ann"})");
  const auto       t    = ctxsync::util::Now();

  auto merged = resolver.Merge(&base, View(R"({"status":"open","owner":"bob"})", t + 5s), View(R"({"status":"closed","owner":"ann"})", t));

  assert(merged.payload.fields().at("status").string_value() == "closed");
  assert(merged.payload.fields().at("owner").string_value() == "bob");
  assert(merged.report.conflicts.size() == 2);
  assert(merged.report.conflicts[0].field == "owner");
  assert(merged.report.conflicts[0].reason == Resolution::kOneSidedChange);
  assert(merged.report.conflicts[1].winner == ctxsync::v1::SOURCE_SYSTEM_B);
  assert(merged.report.Summary() == "owner:A:one_sided_change,status:B:one_sided_change");
  assert(!merged.report.partial);
}

void TestAuthorityBeatsRecency() {
  AuthorityPolicy policy;
  policy.b_authoritative = {"price"};
  ConflictResolver resolver(policy);
  const auto       t = ctxsync::util::Now();

  auto merged = resolver.Merge(nullptr, View(R"({"price":10,"note":"a"})", t + 10s), View(R"({"price":12,"note":"b"})", t));

  assert(merged.payload.fields().at("price").number_value() == 12);
  assert(merged.payload.fields().at("note").string_value() == "a");
  assert(merged.report.Summary() == "note:A:recency,price:B:authority");
}

void TestEqualTimestampsPreferSystemA() {
  ConflictResolver resolver({});
  const auto       t = ctxsync::util::Now();

  auto merged = resolver.Merge(nullptr, View(R"({"k":"a"})", t), View(R"({"k":"b"})", t));
  assert(merged.payload.fields().at("k").string_value() == "a");
  assert(merged.report.conflicts.at(0).reason == Resolution::kTieBreak);

  // Same inputs, same output.
  auto again = resolver.Merge(nullptr, View(R"({"k":"a"})", t), View(R"({"k":"b"})", t));
  assert(ctxsync::util::PayloadEquals(merged.payload, again.payload));
  assert(merged.report.Summary() == again.report.Summary());
}

void TestAgreeingAndDisjointFieldsAreNotConflicts() {
  ConflictResolver resolver({});
  const auto       t = ctxsync::util::Now();

  auto merged = resolver.Merge(nullptr, View(R"({"same":[1,2],"only_a":1})", t), View(R"({"same":[1,2],"only_b":{"x":true}})", t + 1s));
  assert(merged.report.conflicts.empty());
  assert(merged.payload.fields().size() == 3);
  assert(merged.payload.fields().at("only_b").struct_value().fields().at("x").bool_value());
}

void TestUnreachableViewMakesPartialMerge() {
  ConflictResolver resolver({});
  const auto       base = PayloadFromJson(R"({"kept":1,"changed":1})");

  auto merged = resolver.Merge(&base, std::nullopt, View(R"({"changed":2,"added":3})", ctxsync::util::Now()), Reachability{false, true});
  assert(merged.report.partial);
  assert(merged.report.missing.size() == 1 && merged.report.missing[0] == ctxsync::v1::SOURCE_SYSTEM_A);
  assert(merged.payload.fields().at("kept").number_value() == 1);
  assert(merged.payload.fields().at("changed").number_value() == 2);
  assert(merged.payload.fields().at("added").number_value() == 3);
}

void TestReachableSideWithoutContextIsNotPartial() {
  ConflictResolver resolver({});
  const auto       base = PayloadFromJson(R"({"kept":1})");

  auto merged = resolver.Merge(&base, View(R"({"added":2})", ctxsync::util::Now()), std::nullopt);
  assert(!merged.report.partial);
  assert(merged.report.missing.size() == 1 && merged.report.missing[0] == ctxsync::v1::SOURCE_SYSTEM_B);
  assert(merged.payload.fields().at("kept").number_value() == 1);
  assert(merged.payload.fields().at("added").number_value() == 2);
}

void TestOverlappingAuthorityIsRejected() {
  AuthorityPolicy policy;
  policy.a_authoritative = {"x", "y"};
  policy.b_authoritative = {"y"};

  bool threw = false;
  try {
    ConflictResolver resolver(policy);
  } catch (const ctxsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestMergeManyStrategies() {
  const std::vector<ctxsync::v1::Context> contexts = {
      ContextAt(R"({"a":1,"b":1})", 100),
      ContextAt(R"({"b":2,"c":2})", 300),
      ContextAt(R"({"b":3,"d":3})", 200),
  };

  auto unioned = ctxsync::merge::MergeMany(contexts, MergeStrategy::kUnion);
  assert(unioned.fields().size() == 4);
  assert(unioned.fields().at("b").number_value() == 3);

  auto latest = ctxsync::merge::MergeMany(contexts, MergeStrategy::kLatest);
  assert(ctxsync::util::PayloadEquals(latest, contexts[1].payload()));

  auto common = ctxsync::merge::MergeMany(contexts, MergeStrategy::kIntersection);
  assert(common.fields().size() == 1);
  assert(common.fields().at("b").number_value() == 1);

  assert(ctxsync::merge::ParseMergeStrategy("latest") == MergeStrategy::kLatest);
  bool threw = false;
  try {
    (void)ctxsync::merge::ParseMergeStrategy("newest");
  } catch (const ctxsync::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOneSidedChangeWinsOverStaleValue();
  TestAuthorityBeatsRecency();
  TestEqualTimestampsPreferSystemA();
  TestAgreeingAndDisjointFieldsAreNotConflicts();
  TestUnreachableViewMakesPartialMerge();
  TestReachableSideWithoutContextIsNotPartial();
  TestOverlappingAuthorityIsRejected();
  TestMergeManyStrategies();

  std::cout << "ctxsync_unit_conflict_resolver: pass\n";
  return 0;
}
