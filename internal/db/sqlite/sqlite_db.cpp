#include "sqlite_db.hpp"

#include <stdexcept>

namespace saga::db::sqlite {

namespace {

constexpr int kOpenFlags     = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, kOpenFlags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error("sqlite " + path_ + ": " + reason);
}

void SqliteDB::Check(int rc, const char* what) const {
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite " + path_ + " " + what + ": " + sqlite3_errmsg(db_));
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets the recovery scan read while a driver holds the write lock;
  // in-memory databases ignore it
  if (wal_mode && path_ != ":memory:") Exec("PRAGMA journal_mode=WAL;");

  // a committed step transition must survive power loss
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA temp_store=MEMORY;");

  Check(sqlite3_busy_timeout(db_, kBusyTimeoutMs), "busy_timeout");

  // duplicate ids must surface as SQLITE_CONSTRAINT_PRIMARYKEY, not plain SQLITE_CONSTRAINT
  Check(sqlite3_extended_result_codes(db_, 1), "extended_result_codes");
}

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

} // namespace saga::db::sqlite
