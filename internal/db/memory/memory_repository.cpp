#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace saga::db::memory {

namespace {

void SortOldestFirst(std::vector<model::ExecutionRecord>& rows) {
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.updated_at_ms != b.updated_at_ms) return a.updated_at_ms < b.updated_at_ms;
    return a.execution_id < b.execution_id;
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& tx = TX(t);
  if (tx.Lookup(r.execution_id)) return Result::Err(ErrorCode::AlreadyExists, "execution " + r.execution_id + " already exists");
  tx.Writes()[r.execution_id] = {r, std::nullopt};
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  return TX(t).Lookup(id);
}

Result MemoryRepository::UpdateExecution(Transaction& t, model::ExecutionRecord& r, uint64_t expected_version) {
  auto&      tx      = TX(t);
  const auto current = tx.Lookup(r.execution_id);
  if (!current) return Result::Err(ErrorCode::NotFound, "execution " + r.execution_id + " not found");
  if (current->version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "execution " + r.execution_id + " version " + std::to_string(current->version) + " != expected " +
                                                std::to_string(expected_version));
  }

  r.version = expected_version + 1;

  auto& writes = tx.Writes();
  if (auto it = writes.find(r.execution_id); it != writes.end()) {
    it->second.record = r;
  } else {
    writes[r.execution_id] = {r, expected_version};
  }
  return Result::Ok();
}

std::vector<model::ExecutionRecord> MemoryRepository::ListByStatus(Transaction& t, saga::model::ExecutionStatus status, std::size_t limit) {
  std::vector<model::ExecutionRecord> out;
  for (auto& record : TX(t).Snapshot()) {
    if (record.status == status) out.push_back(std::move(record));
  }
  SortOldestFirst(out);
  if (out.size() > limit) out.resize(limit);
  return out;
}

std::vector<model::ExecutionRecord> MemoryRepository::ListStale(Transaction& t, const StaleQuery& query) {
  std::vector<model::ExecutionRecord> out;
  for (auto& record : TX(t).Snapshot()) {
    if (record.updated_at_ms >= query.updated_before_ms) continue;
    if (std::find(query.statuses.begin(), query.statuses.end(), record.status) == query.statuses.end()) continue;
    out.push_back(std::move(record));
  }
  SortOldestFirst(out);
  if (out.size() > query.limit) out.resize(query.limit);
  return out;
}

} // namespace saga::db::memory
