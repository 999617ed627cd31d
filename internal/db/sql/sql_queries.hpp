#pragma once

namespace saga::db::sql {

/*
  Canonical SQL for the SQLite backend.

  The Postgres backend prepares the same statements with $n placeholders
  (see pg_pool.cpp); column order is identical so row decoding is shared in
  spirit.
*/

#define SAGA_EXECUTION_COLUMNS                                                                              \
  "execution_id,saga_type,status,current_step_index,total_steps,context,retry_count,last_error,failed_step," \
  "failure_reason,cancel_requested,created_at_ms,updated_at_ms,completed_at_ms,version"

static constexpr const char* INSERT_EXECUTION =
    "INSERT INTO saga_execution(" SAGA_EXECUTION_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EXECUTION =
    "SELECT " SAGA_EXECUTION_COLUMNS " FROM saga_execution WHERE execution_id=?;";

// Compare-and-set keyed by execution_id, guarded by version.
static constexpr const char* UPDATE_EXECUTION_CAS =
    "UPDATE saga_execution SET status=?,current_step_index=?,context=?,retry_count=?,last_error=?,"
    "failed_step=?,failure_reason=?,cancel_requested=?,updated_at_ms=?,completed_at_ms=?,version=version+1"
    " WHERE execution_id=? AND version=?;";

static constexpr const char* SELECT_BY_STATUS =
    "SELECT " SAGA_EXECUTION_COLUMNS " FROM saga_execution WHERE status=?"
    " ORDER BY updated_at_ms ASC, execution_id ASC LIMIT ?;";

// Statuses are bound as a JSON array and expanded with json_each.
static constexpr const char* SELECT_STALE =
    "SELECT " SAGA_EXECUTION_COLUMNS " FROM saga_execution"
    " WHERE status IN (SELECT value FROM json_each(?)) AND updated_at_ms < ?"
    " ORDER BY updated_at_ms ASC, execution_id ASC LIMIT ?;";

}
