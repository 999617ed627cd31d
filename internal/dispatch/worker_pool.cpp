#include "worker_pool.hpp"

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"

namespace saga::dispatch {

using observability::ExecutionField;
using observability::StringField;

WorkerPool::WorkerPool(std::shared_ptr<DispatchQueue> queue, std::shared_ptr<saga::core::Orchestrator> orchestrator, std::size_t threads)
    : queue_(std::move(queue)), orchestrator_(std::move(orchestrator)), thread_count_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (running_) {
    auto execution_id = queue_->Dequeue();
    if (!execution_id) break;

    Process(*execution_id);
  }
}

void WorkerPool::Process(const std::string& execution_id) {
  try {
    for (;;) {
      const auto result = orchestrator_->Advance(execution_id);
      if (result.outcome == saga::core::AdvanceOutcome::kContinue && running_) continue;

      if (result.outcome == saga::core::AdvanceOutcome::kRetryLater) {
        queue_->EnqueueAfter(execution_id, result.delay);
        return;
      }
      break;
    }
  } catch (const std::exception& e) {
    // Left non-terminal; the recovery scanner picks it up again.
    SAGA_LOG_ERROR("advancing execution failed", {ExecutionField(execution_id), StringField("error", e.what())});
  }
  queue_->Done(execution_id);
}

} // namespace saga::dispatch
