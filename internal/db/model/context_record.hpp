#pragma once

#include <cstdint>
#include <string>

namespace ctxsync::db::model {

/*
  Persistent context row (current pointer).

  current_version is the compare-and-swap column: every write goes
  through UpdateContext(expected_version).
*/

struct ContextRecord {
  std::string id;

  uint64_t current_version = 0;

  // google.protobuf.Struct as protobuf JSON
  std::string payload_json;

  // ctxsync.v1.SourceSystem numeric value
  int source_system = 0;

  // empty unless created by a merge
  std::string parent_id;

  uint64_t updated_at_ms = 0;
};

} // namespace ctxsync::db::model
