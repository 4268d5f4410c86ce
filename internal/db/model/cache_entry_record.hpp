#pragma once

#include <cstdint>
#include <string>

namespace ctxsync::db::model {

/*
  Durable cache (L3) row. value holds a ctxsync.v1.Context as protobuf JSON.
*/

struct CacheEntryRecord {
  std::string cache_key;
  std::string value;

  // 0 = never expires
  uint64_t expires_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace ctxsync::db::model
