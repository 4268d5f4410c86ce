#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/context_record.hpp"
#include "internal/db/model/context_version_record.hpp"

namespace ctxsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateContext is a compare-and-swap on current_version:
    it returns Conflict when the stored version differs
  - Deleting a context deletes its versions

  The DB is the source of truth for:
    context pointers
    version history
    durable cache entries (L3)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Contexts
  // ---------------------------------------------------------------------

  virtual Result InsertContext(Transaction&, const model::ContextRecord&) = 0;

  virtual std::optional<model::ContextRecord> GetContext(Transaction&, const std::string& id) = 0;

  virtual Result UpdateContext(Transaction&, const model::ContextRecord&, uint64_t expected_version) = 0;

  virtual Result DeleteContext(Transaction&, const std::string& id) = 0;

  // Sorted by id.
  virtual std::vector<std::string> ListContextIds(Transaction&) = 0;

  virtual uint64_t CountContexts(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Versions
  // ---------------------------------------------------------------------

  virtual Result InsertVersion(Transaction&, const model::ContextVersionRecord&) = 0;

  virtual std::optional<model::ContextVersionRecord> GetVersion(Transaction&, const std::string& context_id, uint64_t version) = 0;

  // Newest first. before_version is exclusive.
  virtual std::vector<model::ContextVersionRecord> ListVersions(Transaction&, const std::string& context_id, std::optional<uint64_t> before_version,
                                                                uint64_t limit) = 0;

  virtual uint64_t CountVersions(Transaction&, const std::string& context_id) = 0;

  virtual uint64_t CountAllVersions(Transaction&) = 0;

  // Removes versions with version > max_version.
  virtual Result DeleteVersionsAbove(Transaction&, const std::string& context_id, uint64_t max_version) = 0;

  // Keeps the newest max_versions rows; *removed receives the deleted count.
  virtual Result TrimVersionsToMaxCount(Transaction&, const std::string& context_id, uint64_t max_versions, uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Durable cache entries
  // ---------------------------------------------------------------------

  virtual Result UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) = 0;

  virtual Result DeleteCacheEntry(Transaction&, const std::string& key) = 0;

  virtual Result DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms, uint64_t* removed) = 0;

  virtual uint64_t CountCacheEntries(Transaction&) = 0;
};

} // namespace ctxsync::db
