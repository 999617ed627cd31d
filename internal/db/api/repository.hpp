#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/execution_record.hpp"

namespace saga::db {

/*
  Execution record store.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateExecution is a compare-and-set on version: it succeeds only when
    the stored version equals expected_version, and stores
    expected_version + 1 (returned through record.version)
  - Version increments are atomic
  - Records are never deleted by this subsystem

  The DB is the source of truth for saga progress; recovery reads nothing
  else.
*/

struct StaleQuery {
  std::vector<saga::model::ExecutionStatus> statuses;
  // Only records whose updated_at_ms is strictly older than this.
  uint64_t    updated_before_ms = 0;
  std::size_t limit             = 100;
};

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& execution_id) = 0;

  // Conflict when the stored version moved on, NotFound when the row is missing.
  virtual Result UpdateExecution(Transaction&, model::ExecutionRecord& record, uint64_t expected_version) = 0;

  virtual std::vector<model::ExecutionRecord> ListByStatus(Transaction&, saga::model::ExecutionStatus status, std::size_t limit) = 0;

  // Oldest first by updated_at.
  virtual std::vector<model::ExecutionRecord> ListStale(Transaction&, const StaleQuery& query) = 0;
};

} // namespace saga::db
