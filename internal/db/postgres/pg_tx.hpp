#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace saga::db::postgres {

/*
  READ COMMITTED pqxx::work pinned to one pooled connection for its whole
  life. Writers of the same execution serialize on the row lock taken by
  the version-guarded UPDATE; the loser sees zero affected rows.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;

private:
  PgPool::Lease               conn_;
  std::unique_ptr<pqxx::work> work_;
  bool                        open_ = true;
};

}
