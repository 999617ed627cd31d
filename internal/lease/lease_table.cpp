#include "lease_table.hpp"

namespace saga::lease {

bool LeaseTable::IsExpired(const Lease& lease, Clock::time_point now) {
  return lease.expires_at <= now;
}

std::optional<Lease> LeaseTable::TryInsert(const Lease& lease, Clock::time_point now) {
  std::lock_guard lock(mutex_);

  if (auto existing = by_execution_.find(lease.execution_id); existing != by_execution_.end()) {
    if (!IsExpired(existing->second, now)) return std::nullopt;
    by_execution_.erase(existing);
  }

  by_execution_.emplace(lease.execution_id, lease);
  return lease;
}

void LeaseTable::Remove(const std::string& execution_id, const std::string& lease_id) {
  std::lock_guard lock(mutex_);

  auto it = by_execution_.find(execution_id);
  if (it == by_execution_.end() || it->second.lease_id != lease_id) return;
  by_execution_.erase(it);
}

bool LeaseTable::HasActive(const std::string& execution_id, Clock::time_point now) {
  std::lock_guard lock(mutex_);

  auto it = by_execution_.find(execution_id);
  if (it == by_execution_.end()) return false;
  if (IsExpired(it->second, now)) {
    by_execution_.erase(it);
    return false;
  }
  return true;
}

std::size_t LeaseTable::Size() {
  std::lock_guard lock(mutex_);
  return by_execution_.size();
}

} // namespace saga::lease
