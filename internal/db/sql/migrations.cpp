#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace flowlog::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  FLOWLOG_LOG_DEBUG("schema migrations applied", {observability::IntField("statements", static_cast<int64_t>(ordered_sql.size()))});
}

const std::vector<std::string>& SqliteMigrations() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS flows ("
      " id TEXT PRIMARY KEY,"
      " name TEXT,"
      " status TEXT,"
      " created_by TEXT,"
      " created_at_ms INTEGER NOT NULL,"
      " cursor INTEGER NOT NULL DEFAULT 0,"
      " version INTEGER NOT NULL DEFAULT 0,"
      " parent_flow_id TEXT,"
      " parent_cursor INTEGER,"
      " metadata TEXT NOT NULL DEFAULT 'null');",
      "CREATE INDEX IF NOT EXISTS flows_parent_idx ON flows(parent_flow_id);",
      "CREATE TABLE IF NOT EXISTS flow_data ("
      " id TEXT PRIMARY KEY,"
      " flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE,"
      " cursor INTEGER NOT NULL,"
      " record_key TEXT NOT NULL,"
      " payload TEXT NOT NULL,"
      " metadata TEXT NOT NULL DEFAULT 'null',"
      " command_id TEXT,"
      " version INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " UNIQUE(flow_id, cursor),"
      " UNIQUE(flow_id, command_id));",
      "CREATE TABLE IF NOT EXISTS snapshots ("
      " id TEXT PRIMARY KEY,"
      " flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE,"
      " cursor INTEGER NOT NULL,"
      " state_ptr TEXT NOT NULL,"
      " metadata TEXT NOT NULL DEFAULT 'null',"
      " created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS snapshots_flow_cursor_idx ON snapshots(flow_id, cursor);",
      "CREATE TABLE IF NOT EXISTS flowlog_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT INTO flowlog_schema_migrations(version, applied_at_ms)"
      " VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000) ON CONFLICT(version) DO NOTHING;"};
  return kStatements;
}

const std::vector<std::string>& PostgresMigrations() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS flows ("
      " id TEXT PRIMARY KEY,"
      " name TEXT,"
      " status TEXT,"
      " created_by TEXT,"
      " created_at_ms BIGINT NOT NULL,"
      " cursor BIGINT NOT NULL DEFAULT 0,"
      " version BIGINT NOT NULL DEFAULT 0,"
      " parent_flow_id TEXT,"
      " parent_cursor BIGINT,"
      " metadata JSONB NOT NULL DEFAULT 'null'::jsonb);",
      "CREATE INDEX IF NOT EXISTS flows_parent_idx ON flows(parent_flow_id);",
      "CREATE TABLE IF NOT EXISTS flow_data ("
      " id TEXT PRIMARY KEY,"
      " flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE,"
      " cursor BIGINT NOT NULL,"
      " record_key TEXT NOT NULL,"
      " payload JSONB NOT NULL,"
      " metadata JSONB NOT NULL DEFAULT 'null'::jsonb,"
      " command_id TEXT,"
      " version BIGINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " UNIQUE(flow_id, cursor),"
      " UNIQUE(flow_id, command_id));",
      "CREATE TABLE IF NOT EXISTS snapshots ("
      " id TEXT PRIMARY KEY,"
      " flow_id TEXT NOT NULL REFERENCES flows(id) ON DELETE CASCADE,"
      " cursor BIGINT NOT NULL,"
      " state_ptr TEXT NOT NULL,"
      " metadata JSONB NOT NULL DEFAULT 'null'::jsonb,"
      " created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS snapshots_flow_cursor_idx ON snapshots(flow_id, cursor);",
      "CREATE TABLE IF NOT EXISTS flowlog_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "INSERT INTO flowlog_schema_migrations(version) VALUES(1) ON CONFLICT(version) DO NOTHING;"};
  return kStatements;
}

} // namespace flowlog::db::sql
