#pragma once

#include <cstdint>
#include <string>

namespace ctxsync::db::model {

/*
  Immutable history row, keyed by (context_id, version).

  Stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct ContextVersionRecord {
  std::string context_id;
  uint64_t    version = 0;

  std::string payload_json;
  int         source_system = 0;

  uint64_t created_at_ms = 0;

  // flat string map (change_type, diff, ...)
  std::string metadata_json;
};

} // namespace ctxsync::db::model
