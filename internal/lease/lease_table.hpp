#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "lease.hpp"

namespace saga::lease {

class LeaseTable {
 public:
  using Clock = std::chrono::steady_clock;

  // Fails while another unexpired lease covers the execution.
  std::optional<Lease> TryInsert(const Lease& lease, Clock::time_point now);

  // No-op unless lease_id is the current holder.
  void Remove(const std::string& execution_id, const std::string& lease_id);

  bool HasActive(const std::string& execution_id, Clock::time_point now);

  std::size_t Size();

 private:
  std::mutex mutex_;

  // keyed by execution_id
  std::unordered_map<std::string, Lease> by_execution_;

  static bool IsExpired(const Lease& lease, Clock::time_point now);
};

} // namespace saga::lease
