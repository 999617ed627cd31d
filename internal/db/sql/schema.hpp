#pragma once

#include <string>
#include <vector>

namespace saga::db::sql {

/*
  Bootstrap DDL per backend.

  One row per execution; status and updated_at indexes back the recovery
  sweep and staleness queries.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS saga_execution ("
      " execution_id TEXT PRIMARY KEY,"
      " saga_type TEXT NOT NULL,"
      " status TEXT NOT NULL,"
      " current_step_index INTEGER NOT NULL,"
      " total_steps INTEGER NOT NULL,"
      " context TEXT NOT NULL,"
      " retry_count INTEGER NOT NULL DEFAULT 0,"
      " last_error TEXT NOT NULL DEFAULT '',"
      " failed_step TEXT NOT NULL DEFAULT '',"
      " failure_reason TEXT NOT NULL DEFAULT '',"
      " cancel_requested INTEGER NOT NULL DEFAULT 0,"
      " created_at_ms INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL,"
      " completed_at_ms INTEGER NOT NULL DEFAULT 0,"
      " version INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_status ON saga_execution(status);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_updated_at ON saga_execution(updated_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_status_updated ON saga_execution(status, updated_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_saga_type ON saga_execution(saga_type);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS saga_execution ("
      " execution_id VARCHAR(36) PRIMARY KEY,"
      " saga_type VARCHAR(100) NOT NULL,"
      " status VARCHAR(20) NOT NULL,"
      " current_step_index INTEGER NOT NULL,"
      " total_steps INTEGER NOT NULL,"
      " context TEXT NOT NULL,"
      " retry_count INTEGER NOT NULL DEFAULT 0,"
      " last_error TEXT NOT NULL DEFAULT '',"
      " failed_step TEXT NOT NULL DEFAULT '',"
      " failure_reason TEXT NOT NULL DEFAULT '',"
      " cancel_requested BOOLEAN NOT NULL DEFAULT FALSE,"
      " created_at_ms BIGINT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL,"
      " completed_at_ms BIGINT NOT NULL DEFAULT 0,"
      " version BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_status ON saga_execution(status);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_updated_at ON saga_execution(updated_at_ms);",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_incomplete ON saga_execution(status, updated_at_ms)"
      " WHERE status IN ('STARTED', 'IN_PROGRESS', 'COMPENSATING');",
      "CREATE INDEX IF NOT EXISTS idx_saga_execution_saga_type ON saga_execution(saga_type);"};
  return kSchema;
}

} // namespace saga::db::sql
