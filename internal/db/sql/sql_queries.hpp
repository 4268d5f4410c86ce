#pragma once

#include <vector>

namespace ctxsync::db::sql {

/*
  Canonical SQL used by the SQLite backend. The Postgres backend prepares
  the same statements with $N placeholders, see PostgresStatements().
*/

// contexts

static constexpr const char* INSERT_CONTEXT =
    "INSERT INTO context(id,current_version,payload,source_system,parent_id,updated_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_CONTEXT =
    "SELECT id,current_version,payload,source_system,parent_id,updated_at_ms"
    " FROM context WHERE id=?;";

static constexpr const char* UPDATE_CONTEXT_CAS =
    "UPDATE context SET current_version=?,payload=?,source_system=?,parent_id=?,updated_at_ms=?"
    " WHERE id=? AND current_version=?;";

static constexpr const char* DELETE_CONTEXT =
    "DELETE FROM context WHERE id=?;";

static constexpr const char* SELECT_CONTEXT_IDS =
    "SELECT id FROM context ORDER BY id;";

static constexpr const char* COUNT_CONTEXTS =
    "SELECT COUNT(*) FROM context;";

// versions

static constexpr const char* INSERT_VERSION =
    "INSERT INTO context_version(context_id,version,payload,source_system,created_at_ms,metadata)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_VERSION =
    "SELECT context_id,version,payload,source_system,created_at_ms,metadata"
    " FROM context_version WHERE context_id=? AND version=?;";

static constexpr const char* SELECT_VERSIONS_PAGE =
    "SELECT context_id,version,payload,source_system,created_at_ms,metadata"
    " FROM context_version WHERE context_id=? AND version<?"
    " ORDER BY version DESC LIMIT ?;";

static constexpr const char* COUNT_VERSIONS =
    "SELECT COUNT(*) FROM context_version WHERE context_id=?;";

static constexpr const char* COUNT_ALL_VERSIONS =
    "SELECT COUNT(*) FROM context_version;";

static constexpr const char* DELETE_VERSIONS_ABOVE =
    "DELETE FROM context_version WHERE context_id=? AND version>?;";

// Keeps the newest N rows of one context.
static constexpr const char* TRIM_VERSIONS =
    "DELETE FROM context_version WHERE context_id=? AND version NOT IN"
    " (SELECT version FROM context_version WHERE context_id=? ORDER BY version DESC LIMIT ?);";

// durable cache

static constexpr const char* UPSERT_CACHE_ENTRY =
    "INSERT INTO cache_entry(cache_key,value,expires_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(cache_key) DO UPDATE SET"
    " value=excluded.value,"
    " expires_at_ms=excluded.expires_at_ms,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CACHE_ENTRY =
    "SELECT cache_key,value,expires_at_ms,updated_at_ms"
    " FROM cache_entry WHERE cache_key=?;";

static constexpr const char* DELETE_CACHE_ENTRY =
    "DELETE FROM cache_entry WHERE cache_key=?;";

static constexpr const char* DELETE_EXPIRED_CACHE_ENTRIES =
    "DELETE FROM cache_entry WHERE expires_at_ms>0 AND expires_at_ms<=?;";

static constexpr const char* COUNT_CACHE_ENTRIES =
    "SELECT COUNT(*) FROM cache_entry;";

// Postgres

struct PreparedStatement {
  const char* name;
  const char* sql;
};

// Installed on every pooled connection; PgRepository calls them by name.
inline const std::vector<PreparedStatement>& PostgresStatements() {
  static const std::vector<PreparedStatement> kStatements = {
      {"insert_context",
       "INSERT INTO context(id,current_version,payload,source_system,parent_id,updated_at_ms) VALUES($1,$2,$3::jsonb,$4,$5,$6)"},
      {"get_context", "SELECT id,current_version,payload::text,source_system,parent_id,updated_at_ms FROM context WHERE id=$1"},
      {"update_context_cas",
       "UPDATE context SET current_version=$2,payload=$3::jsonb,source_system=$4,parent_id=$5,updated_at_ms=$6 "
       "WHERE id=$1 AND current_version=$7"},
      {"delete_context", "DELETE FROM context WHERE id=$1"},
      {"list_context_ids", "SELECT id FROM context ORDER BY id"},
      {"count_contexts", "SELECT COUNT(*) FROM context"},

      {"insert_version",
       "INSERT INTO context_version(context_id,version,payload,source_system,created_at_ms,metadata) VALUES($1,$2,$3::jsonb,$4,$5,$6::jsonb)"},
      {"get_version",
       "SELECT context_id,version,payload::text,source_system,created_at_ms,metadata::text FROM context_version WHERE context_id=$1 AND version=$2"},
      {"list_versions",
       "SELECT context_id,version,payload::text,source_system,created_at_ms,metadata::text FROM context_version "
       "WHERE context_id=$1 AND version<$2 ORDER BY version DESC LIMIT $3"},
      {"count_versions", "SELECT COUNT(*) FROM context_version WHERE context_id=$1"},
      {"count_all_versions", "SELECT COUNT(*) FROM context_version"},
      {"delete_versions_above", "DELETE FROM context_version WHERE context_id=$1 AND version>$2"},
      {"trim_versions",
       "DELETE FROM context_version WHERE context_id=$1 AND version NOT IN "
       "(SELECT version FROM context_version WHERE context_id=$1 ORDER BY version DESC LIMIT $2)"},

      {"upsert_cache_entry",
       "INSERT INTO cache_entry(cache_key,value,expires_at_ms,updated_at_ms) VALUES($1,$2::jsonb,$3,$4) "
       "ON CONFLICT(cache_key) DO UPDATE SET value=EXCLUDED.value,expires_at_ms=EXCLUDED.expires_at_ms,updated_at_ms=EXCLUDED.updated_at_ms"},
      {"get_cache_entry", "SELECT cache_key,value::text,expires_at_ms,updated_at_ms FROM cache_entry WHERE cache_key=$1"},
      {"delete_cache_entry", "DELETE FROM cache_entry WHERE cache_key=$1"},
      {"delete_expired_cache_entries", "DELETE FROM cache_entry WHERE expires_at_ms>0 AND expires_at_ms<=$1"},
      {"count_cache_entries", "SELECT COUNT(*) FROM cache_entry"},
  };
  return kStatements;
}

} // namespace ctxsync::db::sql
