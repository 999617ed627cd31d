#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace saga::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT span on the shared connection.

  The reserved lock taken by BEGIN IMMEDIATE makes the
  UPDATE executions ... WHERE version = ? check race free across processes.
  Threads of this process additionally queue on SqliteDB::TxMutex() because
  they share one sqlite3 handle.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> writer_;
  bool                         open_ = true;
};

}
