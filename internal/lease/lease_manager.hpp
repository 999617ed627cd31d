#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "lease.hpp"
#include "lease_table.hpp"

namespace saga::lease {

class LeaseManager;

/*
  RAII holder for an acquired lease. Releases on destruction.
*/
class LeaseGuard {
public:
  LeaseGuard(LeaseManager& manager, Lease lease);
  ~LeaseGuard();

  LeaseGuard(const LeaseGuard&)            = delete;
  LeaseGuard& operator=(const LeaseGuard&) = delete;
  LeaseGuard(LeaseGuard&& other) noexcept;
  LeaseGuard& operator=(LeaseGuard&&) = delete;

  const Lease& Get() const { return lease_; }

private:
  LeaseManager* manager_;
  Lease lease_;
};

class LeaseManager {
public:
  explicit LeaseManager(std::chrono::milliseconds ttl = std::chrono::seconds(30));

  std::optional<LeaseGuard> TryAcquire(const std::string& execution_id, const std::string& owner);

  void Release(const Lease& lease);

  bool IsHeld(const std::string& execution_id);

  std::chrono::milliseconds Ttl() const { return ttl_; }

private:
  std::chrono::milliseconds ttl_;
  LeaseTable table_;
};

}
