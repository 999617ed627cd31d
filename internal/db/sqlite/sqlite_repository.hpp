#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace saga::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  Result UpdateExecution(Transaction&, model::ExecutionRecord&, uint64_t expected_version) override;
  std::vector<model::ExecutionRecord> ListByStatus(Transaction&, saga::model::ExecutionStatus, std::size_t limit) override;
  std::vector<model::ExecutionRecord> ListStale(Transaction&, const StaleQuery&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
