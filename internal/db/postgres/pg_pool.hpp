#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace saga::db::postgres {

/*
  Bounded set of libpqxx connections for the execution store.

  A pqxx::connection is not thread-safe, so every PgTransaction borrows one
  exclusively. Borrowing blocks once max_connections are out. Each new
  connection gets the execution statements prepared before it is lent.

  A Lease returns its connection when the last copy is dropped; if the pool
  is already gone the connection is closed instead. Broken connections are
  never parked again.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  using Lease = std::shared_ptr<pqxx::connection>;

  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  Lease Acquire();

  // Runs schema statements in one transaction.
  void Bootstrap(const std::vector<std::string>& statements);

 private:
  static void PrepareExecutionStatements(pqxx::connection& conn);
  Lease       Lend(pqxx::connection* conn);
  void        GiveBack(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> parked_;
  std::size_t                                    opened_ = 0;
};

} // namespace saga::db::postgres
