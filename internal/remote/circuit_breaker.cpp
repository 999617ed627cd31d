#include "circuit_breaker.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace saga::remote {

CircuitBreakerOptions CircuitBreakerOptions::FromConfig(const saga::runtime::config::CircuitBreakerConfig& config) {
  CircuitBreakerOptions options;
  if (config.failure_rate_threshold() > 0) options.failure_rate_threshold = config.failure_rate_threshold();
  if (config.sliding_window_size() > 0) options.sliding_window_size = config.sliding_window_size();
  if (config.minimum_calls() > 0) options.minimum_calls = config.minimum_calls();
  if (config.consecutive_failures() > 0) options.consecutive_failures = config.consecutive_failures();
  if (config.half_open_calls() > 0) options.half_open_calls = config.half_open_calls();
  options.open_cooldown = util::ToMillis(config.open_cooldown(), options.open_cooldown);
  return options;
}

CircuitBreaker::CircuitBreaker(CircuitBreakerOptions options, NowFn now) : options_(options), now_(std::move(now)) {
  if (options_.sliding_window_size == 0) options_.sliding_window_size = 1;
  if (options_.half_open_calls == 0) options_.half_open_calls = 1;
}

bool CircuitBreaker::TryAcquire() {
  std::lock_guard lock(mutex_);

  if (state_ == State::kOpen) {
    if (now_() - opened_at_ < options_.open_cooldown) return false;
    state_            = State::kHalfOpen;
    trials_in_flight_ = 0;
    trial_successes_  = 0;
  }

  if (state_ == State::kHalfOpen) {
    if (trials_in_flight_ + trial_successes_ >= options_.half_open_calls) return false;
    ++trials_in_flight_;
  }
  return true;
}

void CircuitBreaker::OnSuccess() {
  Record(false);
}

void CircuitBreaker::OnFailure() {
  Record(true);
}

CircuitBreaker::State CircuitBreaker::GetState() {
  std::lock_guard lock(mutex_);
  // An expired cool-down reads as half-open even before the next call.
  if (state_ == State::kOpen && now_() - opened_at_ >= options_.open_cooldown) return State::kHalfOpen;
  return state_;
}

void CircuitBreaker::Record(bool failed) {
  std::lock_guard lock(mutex_);

  if (state_ == State::kHalfOpen) {
    if (trials_in_flight_ > 0) --trials_in_flight_;
    if (failed) {
      TripLocked(now_());
      return;
    }
    if (++trial_successes_ >= options_.half_open_calls) CloseLocked();
    return;
  }

  // late results of calls admitted before the circuit opened
  if (state_ == State::kOpen) return;

  window_.push_back(failed);
  if (failed) ++window_failures_;
  if (window_.size() > options_.sliding_window_size) {
    if (window_.front()) --window_failures_;
    window_.pop_front();
  }
  consecutive_failures_ = failed ? consecutive_failures_ + 1 : 0;

  if (!failed) return;

  const bool consecutive_trip = options_.consecutive_failures > 0 && consecutive_failures_ >= options_.consecutive_failures;
  const bool rate_trip        = window_.size() >= options_.minimum_calls &&
                         100.0 * static_cast<double>(window_failures_) / static_cast<double>(window_.size()) >= options_.failure_rate_threshold;
  if (consecutive_trip || rate_trip) TripLocked(now_());
}

void CircuitBreaker::TripLocked(Clock::time_point now) {
  state_     = State::kOpen;
  opened_at_ = now;
  window_.clear();
  window_failures_      = 0;
  consecutive_failures_ = 0;
  trials_in_flight_     = 0;
  trial_successes_      = 0;
}

void CircuitBreaker::CloseLocked() {
  state_ = State::kClosed;
  window_.clear();
  window_failures_      = 0;
  consecutive_failures_ = 0;
  trials_in_flight_     = 0;
  trial_successes_      = 0;
}

std::string_view ToString(CircuitBreaker::State state) {
  switch (state) {
    case CircuitBreaker::State::kClosed:
      return "CLOSED";
    case CircuitBreaker::State::kOpen:
      return "OPEN";
    case CircuitBreaker::State::kHalfOpen:
      return "HALF_OPEN";
  }
  return "UNKNOWN";
}

} // namespace saga::remote
