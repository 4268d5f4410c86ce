#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ctxsync::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertContext(Transaction&, const model::ContextRecord&) override;
  std::optional<model::ContextRecord> GetContext(Transaction&, const std::string&) override;
  Result                              UpdateContext(Transaction&, const model::ContextRecord&, uint64_t expected_version) override;
  Result                              DeleteContext(Transaction&, const std::string&) override;
  std::vector<std::string>            ListContextIds(Transaction&) override;
  uint64_t                            CountContexts(Transaction&) override;

  Result                                     InsertVersion(Transaction&, const model::ContextVersionRecord&) override;
  std::optional<model::ContextVersionRecord> GetVersion(Transaction&, const std::string& context_id, uint64_t version) override;
  std::vector<model::ContextVersionRecord>   ListVersions(Transaction&, const std::string& context_id, std::optional<uint64_t> before_version,
                                                          uint64_t limit) override;
  uint64_t                                   CountVersions(Transaction&, const std::string& context_id) override;
  uint64_t                                   CountAllVersions(Transaction&) override;
  Result DeleteVersionsAbove(Transaction&, const std::string& context_id, uint64_t max_version) override;
  Result TrimVersionsToMaxCount(Transaction&, const std::string& context_id, uint64_t max_versions, uint64_t* removed) override;

  Result                                 UpsertCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& key) override;
  Result                                 DeleteCacheEntry(Transaction&, const std::string& key) override;
  Result                                 DeleteExpiredCacheEntries(Transaction&, uint64_t now_ms, uint64_t* removed) override;
  uint64_t                               CountCacheEntries(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace ctxsync::db::sqlite
