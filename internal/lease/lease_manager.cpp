#include "lease_manager.hpp"

#include "internal/util/uuid.hpp"

namespace saga::lease {

LeaseGuard::LeaseGuard(LeaseManager& manager, Lease lease) : manager_(&manager), lease_(std::move(lease)) {
}

LeaseGuard::LeaseGuard(LeaseGuard&& other) noexcept : manager_(other.manager_), lease_(std::move(other.lease_)) {
  other.manager_ = nullptr;
}

LeaseGuard::~LeaseGuard() {
  if (manager_) manager_->Release(lease_);
}

LeaseManager::LeaseManager(std::chrono::milliseconds ttl) : ttl_(ttl) {
}

std::optional<LeaseGuard> LeaseManager::TryAcquire(const std::string& execution_id, const std::string& owner) {
  const auto now = LeaseTable::Clock::now();

  Lease lease;
  lease.lease_id     = util::GenerateUUIDString();
  lease.execution_id = execution_id;
  lease.owner        = owner;
  lease.expires_at   = now + ttl_;

  auto inserted = table_.TryInsert(lease, now);
  if (!inserted) return std::nullopt;
  return std::optional<LeaseGuard>(std::in_place, *this, std::move(*inserted));
}

void LeaseManager::Release(const Lease& lease) {
  table_.Remove(lease.execution_id, lease.lease_id);
}

bool LeaseManager::IsHeld(const std::string& execution_id) {
  return table_.HasActive(execution_id, LeaseTable::Clock::now());
}

} // namespace saga::lease
