#include "dispatch_queue.hpp"

namespace saga::dispatch {

bool DispatchQueue::Enqueue(const std::string& execution_id) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || !in_flight_.insert(execution_id).second) return false;
    ready_.push(execution_id);
  }
  cv_.notify_one();
  return true;
}

void DispatchQueue::EnqueueAfter(const std::string& execution_id, std::chrono::milliseconds delay) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return;
    in_flight_.insert(execution_id);
    delayed_.push({Clock::now() + delay, execution_id});
  }
  // wake a waiter so it re-arms its timeout on the new earliest due time
  cv_.notify_one();
}

std::optional<std::string> DispatchQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  for (;;) {
    if (shutdown_) return std::nullopt;

    const auto now = Clock::now();
    while (!delayed_.empty() && delayed_.top().due <= now) {
      ready_.push(delayed_.top().execution_id);
      delayed_.pop();
    }

    if (!ready_.empty()) {
      auto execution_id = std::move(ready_.front());
      ready_.pop();
      return execution_id;
    }

    if (delayed_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, delayed_.top().due);
    }
  }
}

void DispatchQueue::Done(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  in_flight_.erase(execution_id);
}

void DispatchQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t DispatchQueue::InFlight() {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

} // namespace saga::dispatch
