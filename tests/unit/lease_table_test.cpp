#include "internal/lease/lease_table.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <utility>

#include "internal/lease/lease_manager.hpp"

namespace {

using saga::lease::Lease;
using saga::lease::LeaseManager;
using saga::lease::LeaseTable;

Lease MakeLease(const std::string& lease_id, const std::string& execution_id, LeaseTable::Clock::time_point expires_at) {
  Lease lease;
  lease.lease_id     = lease_id;
  lease.execution_id = execution_id;
  lease.owner        = "worker-" + lease_id;
  lease.expires_at   = expires_at;
  return lease;
}

void TestExpiredLeaseIsInactive() {
  LeaseTable table;
  const auto now = LeaseTable::Clock::now();

  assert(table.TryInsert(MakeLease("lease-expired", "exec-expired", now - std::chrono::seconds(1)), now - std::chrono::seconds(2)));

  assert(!table.HasActive("exec-expired", now));
  assert(table.Size() == 0);
}

void TestActiveLeaseBlocksSecondHolder() {
  LeaseTable table;
  const auto now = LeaseTable::Clock::now();

  assert(table.TryInsert(MakeLease("lease-a", "exec-1", now + std::chrono::seconds(30)), now));
  assert(!table.TryInsert(MakeLease("lease-b", "exec-1", now + std::chrono::seconds(30)), now));
  assert(table.TryInsert(MakeLease("lease-c", "exec-2", now + std::chrono::seconds(30)), now));

  // once the first lease expires the execution can be claimed again
  const auto later = now + std::chrono::seconds(31);
  assert(table.TryInsert(MakeLease("lease-b", "exec-1", later + std::chrono::seconds(30)), later));
  assert(table.HasActive("exec-1", later));
}

void TestRemoveIgnoresStaleHolder() {
  LeaseTable table;
  const auto now = LeaseTable::Clock::now();

  assert(table.TryInsert(MakeLease("lease-old", "exec-1", now + std::chrono::seconds(1)), now));
  const auto later = now + std::chrono::seconds(2);
  assert(table.TryInsert(MakeLease("lease-new", "exec-1", later + std::chrono::seconds(30)), later));

  table.Remove("exec-1", "lease-old");
  assert(table.HasActive("exec-1", later));

  table.Remove("exec-1", "lease-new");
  assert(!table.HasActive("exec-1", later));
}

void TestGuardReleasesOnScopeExit() {
  LeaseManager manager(std::chrono::seconds(30));

  {
    auto guard = manager.TryAcquire("exec-guarded", "owner-a");
    assert(guard.has_value());
    assert(guard->Get().owner == "owner-a");
    assert(manager.IsHeld("exec-guarded"));
    assert(!manager.TryAcquire("exec-guarded", "owner-b").has_value());

    auto moved = std::move(*guard);
    guard.reset();
    // the moved-from guard released nothing
    assert(manager.IsHeld("exec-guarded"));
  }

  assert(!manager.IsHeld("exec-guarded"));
  assert(manager.TryAcquire("exec-guarded", "owner-b").has_value());
}

} // namespace

int main() {
  TestExpiredLeaseIsInactive();
  TestActiveLeaseBlocksSecondHolder();
  TestRemoveIgnoresStaleHolder();
  TestGuardReleasesOnScopeExit();

  std::cout << "saga_orchestrator_unit_lease_table: pass\n";
  return 0;
}
