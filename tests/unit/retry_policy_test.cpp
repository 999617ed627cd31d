#include "internal/core/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "config/config.pb.h"

namespace {

using saga::core::RetryPolicy;
using std::chrono::milliseconds;

void TestBackoffDoublesAndCaps() {
  RetryPolicy policy;
  policy.initial_backoff = milliseconds(100);
  policy.multiplier      = 2.0;
  policy.max_backoff     = milliseconds(500);

  assert(policy.BackoffAfter(0) == milliseconds(0));
  assert(policy.BackoffAfter(1) == milliseconds(100));
  assert(policy.BackoffAfter(2) == milliseconds(200));
  assert(policy.BackoffAfter(3) == milliseconds(400));
  assert(policy.BackoffAfter(4) == milliseconds(500));
  assert(policy.BackoffAfter(30) == milliseconds(500));
}

void TestBackoffIsNonDecreasing() {
  RetryPolicy policy;
  policy.multiplier = 1.5;

  auto previous = policy.BackoffAfter(1);
  for (uint32_t attempt = 2; attempt <= 20; ++attempt) {
    const auto next = policy.BackoffAfter(attempt);
    assert(next >= previous);
    assert(next <= policy.max_backoff);
    previous = next;
  }
}

void TestExhaustedAtMaxAttempts() {
  RetryPolicy policy;
  policy.max_attempts = 3;

  assert(!policy.Exhausted(1));
  assert(!policy.Exhausted(2));
  assert(policy.Exhausted(3));
  assert(policy.Exhausted(4));
}

void TestFromConfigKeepsDefaultsForUnsetFields() {
  RetryPolicy defaults;
  defaults.max_attempts = 7;

  saga::runtime::config::RetryConfig config;
  config.set_multiplier(3.0);
  config.mutable_max_backoff()->set_seconds(2);

  const auto policy = RetryPolicy::FromConfig(config, defaults);
  assert(policy.max_attempts == 7);
  assert(policy.multiplier == 3.0);
  assert(policy.initial_backoff == defaults.initial_backoff);
  assert(policy.max_backoff == milliseconds(2000));
}

} // namespace

int main() {
  TestBackoffDoublesAndCaps();
  TestBackoffIsNonDecreasing();
  TestExhaustedAtMaxAttempts();
  TestFromConfigKeepsDefaultsForUnsetFields();

  std::cout << "saga_orchestrator_unit_retry_policy: pass\n";
  return 0;
}
