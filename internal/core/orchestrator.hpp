#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "saga_definition.hpp"
#include "step.hpp"

namespace saga::lease {
class LeaseManager;
}

namespace saga::observability {
class AlertSink;
}

namespace saga::core {

enum class AdvanceOutcome : std::uint8_t {
  // Progress was persisted; call Advance again.
  kContinue,
  // A retryable failure was persisted; call Advance again after `delay`.
  kRetryLater,
  // The execution is terminal.
  kTerminal,
  // Another owner holds the execution or won the version race.
  kAbandoned,
};

struct AdvanceResult {
  AdvanceOutcome            outcome = AdvanceOutcome::kContinue;
  std::chrono::milliseconds delay{0};
};

/*
  Orchestrator

  Drives execution records through the saga state machine:

    STARTED      -> IN_PROGRESS
    IN_PROGRESS  -> IN_PROGRESS | COMPLETED | COMPENSATING
    COMPENSATING -> COMPENSATING | COMPENSATED | FAILED

  One Advance() performs at most one step call and persists its outcome
  (execute-then-persist). The per-execution lease is held for that call
  only; every write is a compare-and-set on the record version, and a
  writer that loses the race abandons the execution to the winner.

  Step failures, including exceptions thrown by step code, are classified
  into retryable or terminal and never escape Advance(). Definition errors
  (unknown type, step-count mismatch) are thrown as util::DefinitionError.
*/
class Orchestrator {
 public:
  using Dispatch           = std::function<void(const std::string& execution_id)>;
  using CompletionListener = std::function<void(const db::model::ExecutionRecord&)>;
  using Sleeper            = std::function<void(std::chrono::milliseconds)>;

  Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<const SagaRegistry> registry,
               std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<observability::AlertSink> alerts, std::string owner_id = "local");

  // Hands accepted and resumed executions to the worker pool. Without a
  // dispatcher Start/Resume only persist and the caller drives.
  void SetDispatcher(Dispatch dispatch);

  // Invoked once per execution, by the writer that stored the terminal status.
  void SetCompletionListener(CompletionListener listener);

  // Used by Drive() to wait out backoff delays.
  void SetSleeper(Sleeper sleeper);

  // Persists a STARTED record and dispatches it. Throws util::DefinitionError
  // for an unregistered type.
  std::string Start(const std::string& saga_type, const ContextValues& initial_context);

  // Throws util::NotFound.
  db::model::ExecutionRecord GetStatus(const std::string& execution_id);

  // Oldest first, at most `limit` records.
  std::vector<db::model::ExecutionRecord> List(saga::model::ExecutionStatus status, std::size_t limit);

  // Requests cancellation; observed between steps. Throws util::NotFound, or
  // util::InvalidState unless the execution is STARTED or IN_PROGRESS.
  void Cancel(const std::string& execution_id);

  // Recovery entry point. Validates the definition and re-dispatches a
  // non-terminal execution from its persisted status and index.
  void Resume(const std::string& execution_id);

  // Synchronously advances until terminal or abandoned; returns the latest
  // persisted record.
  db::model::ExecutionRecord Drive(const std::string& execution_id);

  AdvanceResult Advance(const std::string& execution_id);

 private:
  using Mutation = std::function<void(db::model::ExecutionRecord&)>;

  std::optional<db::model::ExecutionRecord> Load(const std::string& execution_id);
  const SagaDefinition&                     Validate(const db::model::ExecutionRecord& record) const;

  // CAS write of `mutate(base)`. On a version conflict where only
  // non-progress fields moved (cancel flag), re-applies onto the fresh row.
  std::optional<db::model::ExecutionRecord> Persist(const db::model::ExecutionRecord& base, const Mutation& mutate);

  AdvanceResult StepForward(const SagaDefinition& definition, const db::model::ExecutionRecord& record);
  AdvanceResult StepBackward(const SagaDefinition& definition, const db::model::ExecutionRecord& record);

  StepResult Invoke(const SagaDefinition& definition, const db::model::ExecutionRecord& record, bool compensate);

  AdvanceResult Finish(const std::optional<db::model::ExecutionRecord>& written, AdvanceResult on_success);
  void          OnTerminal(const db::model::ExecutionRecord& record);

  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<const SagaRegistry>       registry_;
  std::shared_ptr<lease::LeaseManager>      leases_;
  std::shared_ptr<observability::AlertSink> alerts_;
  std::string                               owner_id_;

  Dispatch           dispatch_;
  CompletionListener completion_listener_;
  Sleeper            sleeper_;
};

} // namespace saga::core
