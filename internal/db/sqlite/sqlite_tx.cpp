#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace saga::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) return;
  if (sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    SAGA_LOG_WARN("sqlite execution transaction left open", {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

// Both paths hand the writer lock to a local so it is released even when
// the statement throws.
void SqliteTransaction::Commit() {
  open_ = false;
  std::unique_lock<std::mutex> writer = std::move(writer_);
  try {
    db_->Exec("COMMIT;");
  } catch (...) {
    // a failed COMMIT leaves the transaction open on the shared handle
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqliteTransaction::Rollback() {
  open_ = false;
  std::unique_lock<std::mutex> writer = std::move(writer_);
  db_->Exec("ROLLBACK;");
}

} // namespace saga::db::sqlite
