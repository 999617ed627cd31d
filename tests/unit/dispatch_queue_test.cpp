#include "internal/dispatch/dispatch_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/worker_pool.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/alerts.hpp"

namespace {

using saga::dispatch::DispatchQueue;
using saga::model::ExecutionStatus;

void TestInFlightIdsAreNotQueuedTwice() {
  DispatchQueue queue;
  assert(queue.Enqueue("exec-1"));
  assert(!queue.Enqueue("exec-1"));
  assert(queue.Enqueue("exec-2"));
  assert(queue.InFlight() == 2);

  assert(queue.Dequeue().value() == "exec-1");
  // still in flight until Done
  assert(!queue.Enqueue("exec-1"));
  queue.Done("exec-1");
  assert(queue.Enqueue("exec-1"));

  assert(queue.Dequeue().value() == "exec-2");
  assert(queue.Dequeue().value() == "exec-1");
}

void TestDelayedIdWaitsForItsDueTime() {
  DispatchQueue queue;
  assert(queue.Enqueue("slow"));
  assert(queue.Dequeue().value() == "slow");

  const auto start = std::chrono::steady_clock::now();
  queue.EnqueueAfter("slow", std::chrono::milliseconds(50));
  assert(!queue.Enqueue("slow"));
  assert(queue.Enqueue("fast"));

  assert(queue.Dequeue().value() == "fast");
  assert(queue.Dequeue().value() == "slow");
  assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(50));
}

void TestShutdownWakesWaiters() {
  DispatchQueue queue;
  std::thread   waiter([&queue] { assert(!queue.Dequeue().has_value()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.Shutdown();
  waiter.join();
  assert(!queue.Enqueue("late"));
}

class CountingAlertSink final : public saga::observability::AlertSink {
 public:
  void Raise(const saga::observability::Alert&) override {
  }
};

void TestWorkerPoolDrivesDispatchedExecutions() {
  int  flaky_failures = 1;
  auto registry       = std::make_shared<saga::core::SagaRegistry>();

  saga::core::RetryPolicy retry;
  retry.initial_backoff = std::chrono::milliseconds(5);
  retry.max_backoff     = std::chrono::milliseconds(5);

  registry->Register(saga::core::SagaDefinition(
      "Pooled",
      {{"first", [](const saga::core::StepCall&) { return saga::core::StepResult::Ok(); },
        [](const saga::core::StepCall&) { return saga::core::StepResult::Ok(); }},
       {"second",
        [&flaky_failures](const saga::core::StepCall&) {
          // only the first execution to get here sees the failure
          static std::mutex mutex;
          std::lock_guard   lock(mutex);
          if (flaky_failures-- > 0) return saga::core::StepResult::Retryable("timeout");
          return saga::core::StepResult::Ok();
        },
        [](const saga::core::StepCall&) { return saga::core::StepResult::Ok(); }}},
      retry));
  registry->Freeze();

  auto queue        = std::make_shared<DispatchQueue>();
  auto orchestrator = std::make_shared<saga::core::Orchestrator>(std::make_shared<saga::db::memory::MemoryRepository>(), registry,
                                                                 std::make_shared<saga::lease::LeaseManager>(), std::make_shared<CountingAlertSink>());
  orchestrator->SetDispatcher([queue](const std::string& id) { queue->Enqueue(id); });

  saga::dispatch::WorkerPool pool(queue, orchestrator, 3);
  pool.Start();

  std::vector<std::string> ids;
  for (int i = 0; i < 8; ++i) ids.push_back(orchestrator->Start("Pooled", {}));

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (queue->InFlight() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  pool.Stop();

  for (const auto& id : ids) {
    assert(orchestrator->GetStatus(id).status == ExecutionStatus::kCompleted);
  }
}

} // namespace

int main() {
  TestInFlightIdsAreNotQueuedTwice();
  TestDelayedIdWaitsForItsDueTime();
  TestShutdownWakesWaiters();
  TestWorkerPoolDrivesDispatchedExecutions();

  std::cout << "saga_orchestrator_unit_dispatch_queue: pass\n";
  return 0;
}
