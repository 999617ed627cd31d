#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace saga::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  Result UpdateExecution(Transaction&, model::ExecutionRecord&, uint64_t expected_version) override;
  std::vector<model::ExecutionRecord> ListByStatus(Transaction&, saga::model::ExecutionStatus, std::size_t limit) override;
  std::vector<model::ExecutionRecord> ListStale(Transaction&, const StaleQuery&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
