#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace saga::core {

std::chrono::milliseconds RetryPolicy::BackoffAfter(uint32_t failed_attempts) const {
  if (failed_attempts == 0) return std::chrono::milliseconds(0);

  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(std::max(multiplier, 1.0), failed_attempts - 1);
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

RetryPolicy RetryPolicy::FromConfig(const saga::runtime::config::RetryConfig& config, const RetryPolicy& defaults) {
  RetryPolicy policy = defaults;
  if (config.max_attempts() > 0) policy.max_attempts = config.max_attempts();
  if (config.multiplier() > 0) policy.multiplier = config.multiplier();
  if (config.has_initial_backoff()) policy.initial_backoff = util::ToMillis(config.initial_backoff(), defaults.initial_backoff);
  if (config.has_max_backoff()) policy.max_backoff = util::ToMillis(config.max_backoff(), defaults.max_backoff);
  return policy;
}

} // namespace saga::core
