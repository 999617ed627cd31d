#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace saga::db::memory {

/*
  Transaction = committed rows + private write set

  Reads fall through to committed rows unless this transaction wrote the
  row. Commit re-validates every written row against the version it was
  based on, so two transactions touching different executions never
  conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  struct PendingWrite {
    model::ExecutionRecord record;
    // nullopt for inserts
    std::optional<uint64_t> base_version;
  };

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  std::optional<model::ExecutionRecord> Lookup(const std::string& execution_id) const;
  std::vector<model::ExecutionRecord>   Snapshot() const;

  std::unordered_map<std::string, PendingWrite>& Writes() {
    return writes_;
  }

 private:
  MemoryRepository&                             repo_;
  std::unordered_map<std::string, PendingWrite> writes_;
  bool                                          open_ = true;
};

} // namespace saga::db::memory
