#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ctxsync/v1.hpp"

namespace ctxsync::cache {

/*
  One storage level of the context cache.

  Values are committed Context snapshots. Implementations may throw on
  backend failure; TierCache turns that into a miss at this tier.
*/
class TierStore {
 public:
  virtual ~TierStore() = default;

  virtual std::optional<v1::Context> Get(const std::string& key) = 0;

  virtual void Set(const std::string& key, const v1::Context& value) = 0;

  virtual void Delete(const std::string& key) = 0;

  virtual uint64_t Size() = 0;

  // Returns the number of entries removed.
  virtual uint64_t PurgeExpired() = 0;
};

} // namespace ctxsync::cache
