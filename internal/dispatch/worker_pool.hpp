#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "dispatch_queue.hpp"

namespace saga::core {
class Orchestrator;
}

namespace saga::dispatch {

/*
  Fixed pool of threads that advance executions taken from a DispatchQueue.

  A worker keeps advancing one execution while it makes progress, hands it
  back to the delayed queue on a retry backoff, and marks it done once it is
  terminal or abandoned.
*/
class WorkerPool {
 public:
  WorkerPool(std::shared_ptr<DispatchQueue> queue, std::shared_ptr<saga::core::Orchestrator> orchestrator, std::size_t threads);
  ~WorkerPool();

  void Start();
  void Stop();

 private:
  void Run();
  void Process(const std::string& execution_id);

  std::shared_ptr<DispatchQueue>            queue_;
  std::shared_ptr<saga::core::Orchestrator> orchestrator_;
  std::size_t                               thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace saga::dispatch
