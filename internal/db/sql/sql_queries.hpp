#pragma once

namespace uploader::db::sql {

/*
  Ledger SQL.

  Unprefixed statements are SQLite (? placeholders); PG_ statements are
  the PostgreSQL equivalents ($n placeholders, BIGINT columns).
*/

// schema

static constexpr const char* CREATE_UPLOAD_FILES =
    "CREATE TABLE IF NOT EXISTS upload_files ("
    " task_id TEXT NOT NULL,"
    " remote_key TEXT NOT NULL,"
    " file_name TEXT NOT NULL,"
    " file_size INTEGER NOT NULL,"
    " file_type TEXT NOT NULL,"
    " upload_status TEXT NOT NULL,"
    " uploaded_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (task_id, remote_key));";

static constexpr const char* CREATE_UPLOADS =
    "CREATE TABLE IF NOT EXISTS uploads ("
    " task_id TEXT PRIMARY KEY,"
    " uploaded_files INTEGER NOT NULL,"
    " skipped_files INTEGER NOT NULL,"
    " failed_files INTEGER NOT NULL,"
    " uploaded_bytes INTEGER NOT NULL,"
    " status TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);";

// PostgreSQL flavour of the schema

static constexpr const char* PG_CREATE_UPLOAD_FILES =
    "CREATE TABLE IF NOT EXISTS upload_files ("
    " task_id TEXT NOT NULL,"
    " remote_key TEXT NOT NULL,"
    " file_name TEXT NOT NULL,"
    " file_size BIGINT NOT NULL,"
    " file_type TEXT NOT NULL,"
    " upload_status TEXT NOT NULL,"
    " uploaded_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (task_id, remote_key));";

static constexpr const char* PG_CREATE_UPLOADS =
    "CREATE TABLE IF NOT EXISTS uploads ("
    " task_id TEXT PRIMARY KEY,"
    " uploaded_files BIGINT NOT NULL,"
    " skipped_files BIGINT NOT NULL,"
    " failed_files BIGINT NOT NULL,"
    " uploaded_bytes BIGINT NOT NULL,"
    " status TEXT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);";

// ledger

static constexpr const char* TABLE_EXISTS =
    "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?;";

static constexpr const char* SELECT_COMPLETED_KEYS =
    "SELECT remote_key FROM upload_files WHERE task_id=? ORDER BY remote_key;";

static constexpr const char* INSERT_COMPLETION =
    "INSERT INTO upload_files(task_id,remote_key,file_name,file_size,file_type,upload_status,uploaded_at_ms)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(task_id,remote_key) DO NOTHING;";

static constexpr const char* SELECT_SUMMARY =
    "SELECT task_id,uploaded_files,skipped_files,failed_files,uploaded_bytes,status,updated_at_ms"
    " FROM uploads WHERE task_id=?;";

static constexpr const char* UPSERT_SUMMARY =
    "INSERT INTO uploads(task_id,uploaded_files,skipped_files,failed_files,uploaded_bytes,status,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(task_id) DO UPDATE SET"
    " uploaded_files=excluded.uploaded_files,"
    " skipped_files=excluded.skipped_files,"
    " failed_files=excluded.failed_files,"
    " uploaded_bytes=excluded.uploaded_bytes,"
    " status=excluded.status,"
    " updated_at_ms=excluded.updated_at_ms;";

// PostgreSQL flavour of the ledger statements

static constexpr const char* PG_TABLE_EXISTS =
    "SELECT COUNT(*) FROM information_schema.tables"
    " WHERE table_schema = current_schema() AND table_name=$1";

static constexpr const char* PG_SELECT_COMPLETED_KEYS =
    "SELECT remote_key FROM upload_files WHERE task_id=$1 ORDER BY remote_key";

static constexpr const char* PG_INSERT_COMPLETION =
    "INSERT INTO upload_files(task_id,remote_key,file_name,file_size,file_type,upload_status,uploaded_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6,$7)"
    " ON CONFLICT (task_id,remote_key) DO NOTHING";

static constexpr const char* PG_SELECT_SUMMARY =
    "SELECT task_id,uploaded_files,skipped_files,failed_files,uploaded_bytes,status,updated_at_ms"
    " FROM uploads WHERE task_id=$1";

static constexpr const char* PG_UPSERT_SUMMARY =
    "INSERT INTO uploads(task_id,uploaded_files,skipped_files,failed_files,uploaded_bytes,status,updated_at_ms)"
    " VALUES($1,$2,$3,$4,$5,$6,$7)"
    " ON CONFLICT (task_id) DO UPDATE SET"
    " uploaded_files=EXCLUDED.uploaded_files,"
    " skipped_files=EXCLUDED.skipped_files,"
    " failed_files=EXCLUDED.failed_files,"
    " uploaded_bytes=EXCLUDED.uploaded_bytes,"
    " status=EXCLUDED.status,"
    " updated_at_ms=EXCLUDED.updated_at_ms";

} // namespace uploader::db::sql
