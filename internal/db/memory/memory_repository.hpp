#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace saga::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  Result UpdateExecution(Transaction&, model::ExecutionRecord&, uint64_t expected_version) override;
  std::vector<model::ExecutionRecord> ListByStatus(Transaction&, saga::model::ExecutionStatus, std::size_t limit) override;
  std::vector<model::ExecutionRecord> ListStale(Transaction&, const StaleQuery&) override;

private:
  friend class MemoryTransaction;

  using Rows = std::unordered_map<std::string, model::ExecutionRecord>;

  std::mutex mutex_;
  Rows committed_;
};

}
