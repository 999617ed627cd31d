#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace saga::db::sqlite {

using saga::db::ErrorCode;
using saga::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order follows SAGA_EXECUTION_COLUMNS.
static model::ExecutionRecord ReadRow(sqlite3_stmt* st) {
    model::ExecutionRecord r;
    r.execution_id = ColText(st, 0);
    r.saga_type = ColText(st, 1);

    const auto status_text = ColText(st, 2);
    const auto status = saga::model::ParseStatus(status_text);
    if (!status) throw std::runtime_error("execution " + r.execution_id + " has unknown status '" + status_text + "'");
    r.status = *status;

    r.current_step_index = ColI32(st, 3);
    r.total_steps = ColI32(st, 4);
    r.context = ColText(st, 5);
    r.retry_count = static_cast<uint32_t>(ColI32(st, 6));
    r.last_error = ColText(st, 7);
    r.failed_step = ColText(st, 8);
    r.failure_reason = ColText(st, 9);
    r.cancel_requested = ColI32(st, 10) != 0;
    r.created_at_ms = ColU64(st, 11);
    r.updated_at_ms = ColU64(st, 12);
    r.completed_at_ms = ColU64(st, 13);
    r.version = ColU64(st, 14);
    return r;
}

static std::vector<model::ExecutionRecord> ReadAll(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::ExecutionRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("sqlite list executions: ") + sqlite3_errmsg(db));
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_EXECUTION);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, r.execution_id);
    BindText(st.Get(), 2, r.saga_type);
    BindText(st.Get(), 3, std::string(saga::model::ToString(r.status)));
    BindI32(st.Get(), 4, r.current_step_index);
    BindI32(st.Get(), 5, r.total_steps);
    BindText(st.Get(), 6, r.context);
    BindI32(st.Get(), 7, static_cast<int>(r.retry_count));
    BindText(st.Get(), 8, r.last_error);
    BindText(st.Get(), 9, r.failed_step);
    BindText(st.Get(), 10, r.failure_reason);
    BindI32(st.Get(), 11, r.cancel_requested ? 1 : 0);
    BindU64(st.Get(), 12, r.created_at_ms);
    BindU64(st.Get(), 13, r.updated_at_ms);
    BindU64(st.Get(), 14, r.completed_at_ms);
    BindU64(st.Get(), 15, r.version);

    return Translate(db, sqlite3_step(st.Get()));
}

std::optional<model::ExecutionRecord>
SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_EXECUTION);
    if (!st.Ok()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st.Get(), 1, id);

    int rc = sqlite3_step(st.Get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) throw std::runtime_error(std::string("sqlite get execution: ") + sqlite3_errmsg(db));

    return ReadRow(st.Get());
}

Result SqliteRepository::UpdateExecution(Transaction& t, model::ExecutionRecord& r, uint64_t expected_version) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_EXECUTION_CAS);
    if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st.Get(), 1, std::string(saga::model::ToString(r.status)));
    BindI32(st.Get(), 2, r.current_step_index);
    BindText(st.Get(), 3, r.context);
    BindI32(st.Get(), 4, static_cast<int>(r.retry_count));
    BindText(st.Get(), 5, r.last_error);
    BindText(st.Get(), 6, r.failed_step);
    BindText(st.Get(), 7, r.failure_reason);
    BindI32(st.Get(), 8, r.cancel_requested ? 1 : 0);
    BindU64(st.Get(), 9, r.updated_at_ms);
    BindU64(st.Get(), 10, r.completed_at_ms);
    BindText(st.Get(), 11, r.execution_id);
    BindU64(st.Get(), 12, expected_version);

    auto result = Translate(db, sqlite3_step(st.Get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0) {
        // Either the row is gone or another writer bumped the version.
        if (!GetExecution(t, r.execution_id))
            return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id + " not found");
        return Result::Err(ErrorCode::Conflict,
                           "execution " + r.execution_id + " moved past version " + std::to_string(expected_version));
    }

    r.version = expected_version + 1;
    return Result::Ok();
}

std::vector<model::ExecutionRecord>
SqliteRepository::ListByStatus(Transaction& t, saga::model::ExecutionStatus status, std::size_t limit) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_BY_STATUS);
    if (!st.Ok()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st.Get(), 1, std::string(saga::model::ToString(status)));
    BindU64(st.Get(), 2, limit);

    return ReadAll(db, st.Get());
}

std::vector<model::ExecutionRecord>
SqliteRepository::ListStale(Transaction& t, const StaleQuery& query) {
    auto* db = TX(t).Handle();
    if (query.statuses.empty()) return {};

    Statement st(db, sql::SELECT_STALE);
    if (!st.Ok()) throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    // Status names are fixed identifiers, no escaping needed.
    std::string statuses = "[";
    for (std::size_t i = 0; i < query.statuses.size(); ++i) {
        if (i) statuses += ",";
        statuses += "\"" + std::string(saga::model::ToString(query.statuses[i])) + "\"";
    }
    statuses += "]";

    BindText(st.Get(), 1, statuses);
    BindU64(st.Get(), 2, query.updated_before_ms);
    BindU64(st.Get(), 3, query.limit);

    return ReadAll(db, st.Get());
}

} // namespace saga::db::sqlite
