#pragma once

#include <string>
#include <vector>

namespace ctxsync::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup by the factory and by
  the repository parity test.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS context (id TEXT PRIMARY KEY, current_version INTEGER NOT NULL, payload TEXT NOT NULL, source_system INTEGER NOT NULL, "
      "parent_id TEXT NOT NULL DEFAULT '', updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS context_version (context_id TEXT NOT NULL, version INTEGER NOT NULL, payload TEXT NOT NULL, source_system INTEGER NOT NULL, "
      "created_at_ms INTEGER NOT NULL, metadata TEXT NOT NULL, PRIMARY KEY (context_id, version), "
      "FOREIGN KEY(context_id) REFERENCES context(id) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS cache_entry (cache_key TEXT PRIMARY KEY, value TEXT NOT NULL, expires_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cache_entry_expires_idx ON cache_entry(expires_at_ms);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS context (id TEXT PRIMARY KEY, current_version BIGINT NOT NULL, payload JSONB NOT NULL, source_system SMALLINT NOT NULL, "
      "parent_id TEXT NOT NULL DEFAULT '', updated_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS context_version (context_id TEXT NOT NULL REFERENCES context(id) ON DELETE CASCADE, version BIGINT NOT NULL, "
      "payload JSONB NOT NULL, source_system SMALLINT NOT NULL, created_at_ms BIGINT NOT NULL, metadata JSONB NOT NULL, PRIMARY KEY (context_id, version));",
      "CREATE TABLE IF NOT EXISTS cache_entry (cache_key TEXT PRIMARY KEY, value JSONB NOT NULL, expires_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS cache_entry_expires_idx ON cache_entry(expires_at_ms);"};
  return kSchema;
}

} // namespace ctxsync::db::sql
