#pragma once

#include <chrono>
#include <cstdint>

namespace saga::runtime::config {
class RetryConfig;
}

namespace saga::core {

/*
  Bounded exponential backoff.

  Attempt n (1-based) that failed retryably waits
      min(initial_backoff * multiplier^(n-1), max_backoff)
  before attempt n+1. After max_attempts failed attempts the budget is
  exhausted.
*/
struct RetryPolicy {
  uint32_t                  max_attempts    = 5;
  std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(1000);
  double                    multiplier      = 2.0;
  std::chrono::milliseconds max_backoff     = std::chrono::milliseconds(30000);

  std::chrono::milliseconds BackoffAfter(uint32_t failed_attempts) const;

  bool Exhausted(uint32_t failed_attempts) const {
    return failed_attempts >= max_attempts;
  }

  // Unset fields fall back to `defaults`.
  static RetryPolicy FromConfig(const saga::runtime::config::RetryConfig& config, const RetryPolicy& defaults);
};

} // namespace saga::core
