#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace saga::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process. SQLite has no nested transactions on a
  connection, so SqliteTransaction holds TxMutex() from BEGIN to
  COMMIT/ROLLBACK; other processes are held off by BEGIN IMMEDIATE plus the
  busy timeout.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Pragmas, schema bootstrap and transaction control. Throws with the
  // database path in the message.
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);
  void Check(int rc, const char* what) const;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Owns a prepared statement for one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return stmt_ != nullptr;
  }

  sqlite3_stmt* Get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace saga::db::sqlite
