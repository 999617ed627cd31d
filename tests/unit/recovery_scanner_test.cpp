#include "internal/recovery/recovery_scanner.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/orchestrator.hpp"
#include "internal/core/saga_context.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/alerts.hpp"

namespace {

using saga::db::model::ExecutionRecord;
using saga::model::ExecutionStatus;
using saga::recovery::RecoveryOptions;
using saga::recovery::RecoveryScanner;

constexpr uint64_t kMinute = 60 * 1000;
constexpr uint64_t kNow    = 1'700'000'000'000ULL;

class RecordingAlertSink final : public saga::observability::AlertSink {
 public:
  void Raise(const saga::observability::Alert& alert) override {
    alerts.push_back(alert);
  }

  std::vector<saga::observability::Alert> alerts;
};

struct Harness {
  std::shared_ptr<saga::db::memory::MemoryRepository> repository = std::make_shared<saga::db::memory::MemoryRepository>();
  std::shared_ptr<RecordingAlertSink>                  alerts     = std::make_shared<RecordingAlertSink>();
  std::shared_ptr<saga::core::Orchestrator>            orchestrator;
  std::vector<std::string>                             executed;

  Harness() {
    auto registry = std::make_shared<saga::core::SagaRegistry>();
    std::vector<saga::core::Step> steps;
    for (const char* name : {"reserve", "pay", "confirm"}) {
      steps.push_back({name,
                       [this, name = std::string(name)](const saga::core::StepCall&) {
                         executed.push_back(name);
                         return saga::core::StepResult::Ok();
                       },
                       [](const saga::core::StepCall&) { return saga::core::StepResult::Ok(); }});
    }
    registry->Register(saga::core::SagaDefinition("Order", std::move(steps)));
    registry->Freeze();

    orchestrator = std::make_shared<saga::core::Orchestrator>(repository, registry, std::make_shared<saga::lease::LeaseManager>(), alerts);
  }

  void Insert(const std::string& id, ExecutionStatus status, int32_t index, uint64_t created_at_ms, uint64_t updated_at_ms) {
    ExecutionRecord record;
    record.execution_id       = id;
    record.saga_type          = "Order";
    record.status             = status;
    record.current_step_index = index;
    record.total_steps        = 3;
    record.context            = saga::core::SerializeContext({});
    record.created_at_ms      = created_at_ms;
    record.updated_at_ms      = updated_at_ms;
    record.version            = 1;

    auto tx = repository->Begin();
    assert(repository->InsertExecution(*tx, record));
    tx->Commit();
  }

  RecoveryScanner Scanner(std::size_t batch_limit = 100) {
    RecoveryOptions options;
    options.stale_after = std::chrono::minutes(1);
    options.alert_after = std::chrono::minutes(30);
    options.batch_limit = batch_limit;
    return RecoveryScanner(repository, orchestrator, alerts, options);
  }
};

void TestResumesInterruptedExecutionAtPersistedStep() {
  Harness h;
  h.Insert("interrupted", ExecutionStatus::kInProgress, 1, kNow - 5 * kMinute, kNow - 5 * kMinute);

  auto       scanner = h.Scanner();
  const auto stats   = scanner.SweepOnce(kNow);

  assert(stats.resumed == 1);
  assert(stats.alerted == 0);
  assert((h.executed == std::vector<std::string>{"pay", "confirm"}));
  assert(h.orchestrator->GetStatus("interrupted").status == ExecutionStatus::kCompleted);

  // nothing left to recover
  assert(scanner.SweepOnce(kNow + 10 * kMinute).resumed == 0);
}

void TestFreshAndTerminalExecutionsAreSkipped() {
  Harness h;
  h.Insert("fresh", ExecutionStatus::kInProgress, 0, kNow - 10000, kNow - 10000);
  h.Insert("done", ExecutionStatus::kCompleted, 3, kNow - 10 * kMinute, kNow - 10 * kMinute);

  auto       scanner = h.Scanner();
  const auto stats   = scanner.SweepOnce(kNow);

  assert(stats.resumed == 0);
  assert(h.executed.empty());
}

void TestLongRunningExecutionAlertsOnce() {
  Harness h;
  h.Insert("stuck", ExecutionStatus::kCompensating, 1, kNow - 45 * kMinute, kNow - 2 * kMinute);

  auto scanner = h.Scanner();
  auto stats   = scanner.SweepOnce(kNow);
  assert(stats.alerted == 1);
  assert(stats.resumed == 0);
  assert(h.alerts->alerts.size() == 1);
  assert(h.alerts->alerts[0].execution_id == "stuck");
  assert(h.alerts->alerts[0].status == "COMPENSATING");

  stats = scanner.SweepOnce(kNow + kMinute);
  assert(stats.alerted == 0);
  assert(h.alerts->alerts.size() == 1);
  // left for an operator
  assert(h.orchestrator->GetStatus("stuck").status == ExecutionStatus::kCompensating);
}

void TestBatchLimitBoundsOneSweep() {
  Harness h;
  for (int i = 0; i < 5; ++i) {
    h.Insert("exec-" + std::to_string(i), ExecutionStatus::kStarted, 0, kNow - 5 * kMinute, kNow - 5 * kMinute + static_cast<uint64_t>(i));
  }

  auto scanner = h.Scanner(2);
  assert(scanner.SweepOnce(kNow).resumed == 2);
  // oldest first
  assert(h.orchestrator->GetStatus("exec-0").status == ExecutionStatus::kCompleted);
  assert(h.orchestrator->GetStatus("exec-1").status == ExecutionStatus::kCompleted);
  assert(h.orchestrator->GetStatus("exec-4").status == ExecutionStatus::kStarted);

  assert(scanner.SweepOnce(kNow).resumed == 2);
  assert(scanner.SweepOnce(kNow).resumed == 1);
}

void TestAlertedExecutionsDoNotStarveNewerOnes() {
  Harness h;
  h.Insert("stuck-a", ExecutionStatus::kInProgress, 1, kNow - 120 * kMinute, kNow - 120 * kMinute);
  h.Insert("stuck-b", ExecutionStatus::kInProgress, 1, kNow - 120 * kMinute, kNow - 119 * kMinute);
  h.Insert("crashed", ExecutionStatus::kInProgress, 1, kNow - 5 * kMinute, kNow - 5 * kMinute);

  auto scanner = h.Scanner(2);
  auto stats   = scanner.SweepOnce(kNow);
  assert(stats.alerted == 2);
  assert(stats.resumed == 0);

  stats = scanner.SweepOnce(kNow + kMinute);
  assert(stats.alerted == 0);
  assert(stats.resumed == 1);
  assert(h.orchestrator->GetStatus("crashed").status == ExecutionStatus::kCompleted);
  assert(h.orchestrator->GetStatus("stuck-a").status == ExecutionStatus::kInProgress);
  assert(h.alerts->alerts.size() == 2);
}

void TestDefinitionMismatchCountsAsFailed() {
  Harness h;
  {
    ExecutionRecord record;
    record.execution_id  = "mismatch";
    record.saga_type     = "Order";
    record.status        = saga::model::ExecutionStatus::kInProgress;
    record.total_steps   = 4;
    record.created_at_ms = kNow - 5 * kMinute;
    record.updated_at_ms = kNow - 5 * kMinute;
    record.version       = 1;
    auto tx              = h.repository->Begin();
    assert(h.repository->InsertExecution(*tx, record));
    tx->Commit();
  }

  auto       scanner = h.Scanner();
  const auto stats   = scanner.SweepOnce(kNow);
  assert(stats.failed == 1);
  assert(stats.resumed == 0);
}

} // namespace

int main() {
  TestResumesInterruptedExecutionAtPersistedStep();
  TestFreshAndTerminalExecutionsAreSkipped();
  TestLongRunningExecutionAlertsOnce();
  TestBatchLimitBoundsOneSweep();
  TestAlertedExecutionsDoNotStarveNewerOnes();
  TestDefinitionMismatchCountsAsFailed();

  std::cout << "saga_orchestrator_unit_recovery_scanner: pass\n";
  return 0;
}
