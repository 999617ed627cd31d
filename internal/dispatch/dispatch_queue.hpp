#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace saga::dispatch {

/*
  Thread-safe blocking queue of execution ids for the worker pool.

  An id stays "in flight" from Enqueue until Done, including while it waits
  in the delayed queue for a retry backoff, so the same execution is never
  queued twice and never advanced by two workers of this process.
*/
class DispatchQueue {
 public:
  using Clock = std::chrono::steady_clock;

  // false when the id is already in flight
  bool Enqueue(const std::string& execution_id);

  // Re-queues an in-flight id once `delay` has passed.
  void EnqueueAfter(const std::string& execution_id, std::chrono::milliseconds delay);

  // blocking wait; nullopt after Shutdown
  std::optional<std::string> Dequeue();

  void Done(const std::string& execution_id);

  void Shutdown();

  std::size_t InFlight();

 private:
  struct Delayed {
    Clock::time_point due;
    std::string       execution_id;

    bool operator>(const Delayed& other) const {
      return due > other.due;
    }
  };

  std::mutex                                                       mutex_;
  std::condition_variable                                          cv_;
  std::queue<std::string>                                          ready_;
  std::priority_queue<Delayed, std::vector<Delayed>, std::greater<>> delayed_;
  std::unordered_set<std::string>                                  in_flight_;
  bool                                                             shutdown_ = false;
};

} // namespace saga::dispatch
