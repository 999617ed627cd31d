#pragma once

namespace saga::db {

/*
  Unit of work against the execution store.

  Every backend guarantees:
  - writes stay private to the transaction until Commit()
  - a transaction destroyed without Commit() or Rollback() is rolled back
  - Commit() throws util::Conflict when another committed transaction
    changed an execution this one wrote

  Version races on a single row are reported earlier, by UpdateExecution,
  as ErrorCode::Conflict. SQLite runs BEGIN IMMEDIATE under a per-database
  mutex, Postgres runs pqxx::work on a pooled connection and the memory
  store keeps a per-row write set that is validated at commit.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;
};

}
