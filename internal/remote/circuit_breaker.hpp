#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>

namespace saga::runtime::config {
class CircuitBreakerConfig;
}

namespace saga::remote {

struct CircuitBreakerOptions {
  // Percent of failed calls in the window that opens the circuit.
  double      failure_rate_threshold = 50.0;
  std::size_t sliding_window_size    = 10;
  std::size_t minimum_calls          = 5;
  // 0 disables the consecutive-failure trigger.
  std::size_t               consecutive_failures = 5;
  std::chrono::milliseconds open_cooldown{std::chrono::seconds(30)};
  std::size_t               half_open_calls = 3;

  static CircuitBreakerOptions FromConfig(const saga::runtime::config::CircuitBreakerConfig& config);
};

/*
  Count-based circuit breaker.

  CLOSED    calls pass; opens on `consecutive_failures` in a row or when the
            failure rate over the last `sliding_window_size` calls reaches
            the threshold with at least `minimum_calls` recorded
  OPEN      calls are refused until `open_cooldown` has passed
  HALF_OPEN up to `half_open_calls` calls pass; all succeeding closes the
            circuit, any failure re-opens it
*/
class CircuitBreaker {
 public:
  enum class State : std::uint8_t { kClosed, kOpen, kHalfOpen };

  using Clock    = std::chrono::steady_clock;
  using NowFn    = std::function<Clock::time_point()>;

  explicit CircuitBreaker(CircuitBreakerOptions options, NowFn now = [] { return Clock::now(); });

  // false when the call must short-circuit
  bool TryAcquire();

  void OnSuccess();
  void OnFailure();

  State GetState();

 private:
  void Record(bool failed);
  void TripLocked(Clock::time_point now);
  void CloseLocked();

  CircuitBreakerOptions options_;
  NowFn                 now_;

  std::mutex        mutex_;
  State             state_ = State::kClosed;
  std::deque<bool>  window_;
  std::size_t       window_failures_     = 0;
  std::size_t       consecutive_failures_ = 0;
  Clock::time_point opened_at_{};
  std::size_t       trials_in_flight_ = 0;
  std::size_t       trial_successes_  = 0;
};

std::string_view ToString(CircuitBreaker::State state);

} // namespace saga::remote
