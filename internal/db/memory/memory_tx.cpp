#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace saga::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (open_) Rollback();
}

std::optional<model::ExecutionRecord> MemoryTransaction::Lookup(const std::string& execution_id) const {
  if (auto it = writes_.find(execution_id); it != writes_.end()) {
    return it->second.record;
  }

  std::scoped_lock lock(repo_.mutex_);
  auto             it = repo_.committed_.find(execution_id);
  if (it == repo_.committed_.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ExecutionRecord> MemoryTransaction::Snapshot() const {
  std::vector<model::ExecutionRecord> rows;
  {
    std::scoped_lock lock(repo_.mutex_);
    rows.reserve(repo_.committed_.size() + writes_.size());
    for (const auto& [id, record] : repo_.committed_) {
      if (!writes_.contains(id)) rows.push_back(record);
    }
  }
  for (const auto& [_, write] : writes_) {
    rows.push_back(write.record);
  }
  return rows;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);

  for (const auto& [id, write] : writes_) {
    auto it = repo_.committed_.find(id);
    if (!write.base_version) {
      if (it != repo_.committed_.end()) {
        throw util::Conflict("transaction conflict: execution " + id + " was inserted concurrently");
      }
      continue;
    }
    if (it == repo_.committed_.end() || it->second.version != *write.base_version) {
      throw util::Conflict("transaction conflict: execution " + id + " was modified by a concurrent transaction");
    }
  }

  for (auto& [id, write] : writes_) {
    repo_.committed_[id] = std::move(write.record);
  }
  writes_.clear();
  open_ = false;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  open_ = false;
}

} // namespace saga::db::memory
