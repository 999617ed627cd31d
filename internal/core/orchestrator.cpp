#include "orchestrator.hpp"

#include <stdexcept>
#include <thread>

#include "internal/lease/lease_manager.hpp"
#include "internal/observability/alerts.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "saga_context.hpp"

namespace saga::core {

using db::model::ExecutionRecord;
using saga::model::ExecutionStatus;
using observability::IntField;
using observability::ExecutionField;
using observability::StringField;

namespace {

// Attempts at re-applying a transition after losing to a non-progress write.
constexpr int kPersistAttempts = 3;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message + " (" + std::string(db::ErrorCodeName(result.code)) + ")");
  }
}

// Fields that only the advancing owner writes.
bool SameProgress(const ExecutionRecord& a, const ExecutionRecord& b) {
  return a.status == b.status && a.current_step_index == b.current_step_index && a.retry_count == b.retry_count && a.context == b.context;
}

std::string StatusName(ExecutionStatus status) {
  return std::string(saga::model::ToString(status));
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<const SagaRegistry> registry,
                           std::shared_ptr<lease::LeaseManager> leases, std::shared_ptr<observability::AlertSink> alerts, std::string owner_id)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      leases_(std::move(leases)),
      alerts_(std::move(alerts)),
      owner_id_(std::move(owner_id)),
      sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
  if (!registry_->Frozen()) throw util::InvalidState("saga registry must be frozen before the orchestrator starts");
}

void Orchestrator::SetDispatcher(Dispatch dispatch) {
  dispatch_ = std::move(dispatch);
}

void Orchestrator::SetCompletionListener(CompletionListener listener) {
  completion_listener_ = std::move(listener);
}

void Orchestrator::SetSleeper(Sleeper sleeper) {
  sleeper_ = std::move(sleeper);
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

std::string Orchestrator::Start(const std::string& saga_type, const ContextValues& initial_context) {
  const auto& definition = registry_->Get(saga_type);

  ExecutionRecord record;
  record.execution_id       = util::GenerateUUIDString();
  record.saga_type          = saga_type;
  record.status             = ExecutionStatus::kStarted;
  record.current_step_index = 0;
  record.total_steps        = definition.StepCount();
  record.context            = SerializeContext(initial_context);
  record.created_at_ms      = util::NowMillis();
  record.updated_at_ms      = record.created_at_ms;
  record.version            = 1;

  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertExecution(*tx, record), "insert execution " + record.execution_id);
    tx->Commit();
  }

  SAGA_LOG_INFO("saga started",
                {ExecutionField(record.execution_id), StringField("saga_type", saga_type), IntField("total_steps", record.total_steps)});

  if (dispatch_) dispatch_(record.execution_id);
  return record.execution_id;
}

ExecutionRecord Orchestrator::GetStatus(const std::string& execution_id) {
  auto record = Load(execution_id);
  if (!record) throw util::NotFound("execution not found: " + execution_id);
  return *record;
}

std::vector<ExecutionRecord> Orchestrator::List(ExecutionStatus status, std::size_t limit) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListByStatus(*tx, status, limit);
  tx->Commit();
  return records;
}

void Orchestrator::Cancel(const std::string& execution_id) {
  for (int attempt = 0; attempt < kPersistAttempts; ++attempt) {
    auto record = GetStatus(execution_id);
    if (record.status != ExecutionStatus::kStarted && record.status != ExecutionStatus::kInProgress) {
      throw util::InvalidState("execution " + execution_id + " cannot be cancelled in status " + StatusName(record.status));
    }
    if (record.cancel_requested) return;

    const auto expected      = record.version;
    record.cancel_requested  = true;
    record.updated_at_ms     = util::NowMillis();

    auto tx     = repository_->Begin();
    auto result = repository_->UpdateExecution(*tx, record, expected);
    if (result) {
      tx->Commit();
      SAGA_LOG_INFO("saga cancel requested", {ExecutionField(execution_id), IntField("step_index", record.current_step_index)});
      return;
    }
    if (result.code != db::ErrorCode::Conflict) ThrowIfDbError(result, "cancel execution " + execution_id);
  }
  throw util::Conflict("execution " + execution_id + " kept changing while recording cancel");
}

void Orchestrator::Resume(const std::string& execution_id) {
  const auto record = GetStatus(execution_id);
  if (saga::model::IsTerminal(record.status)) {
    SAGA_LOG_DEBUG("resume skipped, execution is terminal", {ExecutionField(execution_id), StringField("status", StatusName(record.status))});
    return;
  }
  Validate(record);

  SAGA_LOG_INFO("saga resumed", {ExecutionField(execution_id), StringField("status", StatusName(record.status)),
                                 IntField("step_index", record.current_step_index)});

  if (dispatch_) {
    dispatch_(execution_id);
  } else {
    Drive(execution_id);
  }
}

ExecutionRecord Orchestrator::Drive(const std::string& execution_id) {
  for (;;) {
    const auto result = Advance(execution_id);
    if (result.outcome == AdvanceOutcome::kContinue) continue;
    if (result.outcome == AdvanceOutcome::kRetryLater) {
      sleeper_(result.delay);
      continue;
    }
    break;
  }
  return GetStatus(execution_id);
}

AdvanceResult Orchestrator::Advance(const std::string& execution_id) {
  auto record = GetStatus(execution_id);
  if (saga::model::IsTerminal(record.status)) return {AdvanceOutcome::kTerminal};

  const auto& definition = Validate(record);

  auto lease = leases_->TryAcquire(execution_id, owner_id_);
  if (!lease) {
    SAGA_LOG_DEBUG("execution leased by another owner", {ExecutionField(execution_id)});
    return {AdvanceOutcome::kAbandoned};
  }

  // Re-read under the lease; the pre-lease snapshot may be stale.
  record = GetStatus(execution_id);
  switch (record.status) {
    case ExecutionStatus::kStarted:
      return Finish(Persist(record, [](ExecutionRecord& r) { r.status = ExecutionStatus::kInProgress; }), {AdvanceOutcome::kContinue});
    case ExecutionStatus::kInProgress:
      return StepForward(definition, record);
    case ExecutionStatus::kCompensating:
      return StepBackward(definition, record);
    default:
      return {AdvanceOutcome::kTerminal};
  }
}

// ------------------------------------------------------------------
// Forward and compensation
// ------------------------------------------------------------------

AdvanceResult Orchestrator::StepForward(const SagaDefinition& definition, const ExecutionRecord& record) {
  if (record.cancel_requested) {
    // The step at current_step_index never ran; compensation starts below it.
    SAGA_LOG_INFO("saga cancel observed", {ExecutionField(record.execution_id), IntField("completed_steps", record.current_step_index)});
    return Finish(Persist(record,
                          [](ExecutionRecord& r) {
                            r.status         = ExecutionStatus::kCompensating;
                            r.failure_reason = "cancelled";
                            r.retry_count    = 0;
                            r.last_error.clear();
                            r.current_step_index -= 1;
                          }),
                  {AdvanceOutcome::kContinue});
  }

  if (record.current_step_index >= record.total_steps) {
    return Finish(Persist(record, [](ExecutionRecord& r) { r.status = ExecutionStatus::kCompleted; }), {AdvanceOutcome::kContinue});
  }

  const auto& step   = definition.StepAt(record.current_step_index);
  auto        result = Invoke(definition, record, false);

  switch (result.outcome) {
    case StepOutcome::kOk:
      return Finish(Persist(record,
                            [&result](ExecutionRecord& r) {
                              auto context = ParseContext(r.context);
                              MergeFragment(context, result.fragment);
                              r.context = SerializeContext(context);
                              r.current_step_index += 1;
                              r.retry_count = 0;
                              r.last_error.clear();
                              r.status = r.current_step_index == r.total_steps ? ExecutionStatus::kCompleted : ExecutionStatus::kInProgress;
                            }),
                    {AdvanceOutcome::kContinue});

    case StepOutcome::kRetryable: {
      const auto attempts = record.retry_count + 1;
      if (!definition.Retry().Exhausted(attempts)) {
        SAGA_LOG_WARN("step attempt failed, will retry", {ExecutionField(record.execution_id), StringField("step", step.name),
                                                           IntField("attempt", attempts), StringField("error", result.message)});
        return Finish(Persist(record,
                              [&](ExecutionRecord& r) {
                                r.retry_count = attempts;
                                r.last_error  = result.message;
                              }),
                      {AdvanceOutcome::kRetryLater, definition.Retry().BackoffAfter(attempts)});
      }

      SAGA_LOG_WARN("step retry budget exhausted, compensating",
                    {ExecutionField(record.execution_id), StringField("step", step.name), IntField("attempts", attempts)});
      return Finish(Persist(record,
                            [&](ExecutionRecord& r) {
                              r.status         = ExecutionStatus::kCompensating;
                              r.failed_step    = step.name;
                              r.failure_reason = "retries exhausted after " + std::to_string(attempts) + " attempts: " + result.message;
                              r.retry_count    = 0;
                              r.last_error     = result.message;
                            }),
                    {AdvanceOutcome::kContinue});
    }

    case StepOutcome::kTerminal:
      SAGA_LOG_WARN("step failed terminally, compensating",
                    {ExecutionField(record.execution_id), StringField("step", step.name), StringField("reason", result.message)});
      return Finish(Persist(record,
                            [&](ExecutionRecord& r) {
                              // An undecodable context cannot carry the marker; compensating
                              // this step then fails terminally and the execution ends FAILED.
                              if (auto context = TryParseContext(r.context)) {
                                (*context)[kRejectedStepKey] = std::to_string(r.current_step_index);
                                r.context                    = SerializeContext(*context);
                              }
                              r.status         = ExecutionStatus::kCompensating;
                              r.failed_step    = step.name;
                              r.failure_reason = result.message;
                              r.retry_count    = 0;
                              r.last_error     = result.message;
                            }),
                    {AdvanceOutcome::kContinue});
  }
  return {AdvanceOutcome::kAbandoned};
}

AdvanceResult Orchestrator::StepBackward(const SagaDefinition& definition, const ExecutionRecord& record) {
  if (record.current_step_index < 0) {
    return Finish(Persist(record,
                          [](ExecutionRecord& r) {
                            r.status             = ExecutionStatus::kCompensated;
                            r.current_step_index = saga::model::kCompensatedIndex;
                          }),
                  {AdvanceOutcome::kContinue});
  }

  const auto& step   = definition.StepAt(record.current_step_index);
  auto        result = Invoke(definition, record, true);

  if (result.ok()) {
    return Finish(Persist(record,
                          [&result](ExecutionRecord& r) {
                            auto context = ParseContext(r.context);
                            MergeFragment(context, result.fragment);
                            r.context = SerializeContext(context);
                            r.current_step_index -= 1;
                            r.retry_count = 0;
                            r.last_error.clear();
                            r.status = r.current_step_index < 0 ? ExecutionStatus::kCompensated : ExecutionStatus::kCompensating;
                          }),
                  {AdvanceOutcome::kContinue});
  }

  const auto attempts = record.retry_count + 1;
  if (result.outcome == StepOutcome::kRetryable && !definition.Retry().Exhausted(attempts)) {
    SAGA_LOG_WARN("compensation attempt failed, will retry", {ExecutionField(record.execution_id), StringField("step", step.name),
                                                               IntField("attempt", attempts), StringField("error", result.message)});
    return Finish(Persist(record,
                          [&](ExecutionRecord& r) {
                            r.retry_count = attempts;
                            r.last_error  = result.message;
                          }),
                  {AdvanceOutcome::kRetryLater, definition.Retry().BackoffAfter(attempts)});
  }

  const auto reason = result.outcome == StepOutcome::kTerminal
                          ? "compensation of " + step.name + " failed terminally: " + result.message
                          : "compensation of " + step.name + " exhausted " + std::to_string(attempts) + " attempts: " + result.message;
  SAGA_LOG_ERROR("compensation gave up", {ExecutionField(record.execution_id), StringField("step", step.name), StringField("reason", reason)});
  return Finish(Persist(record,
                        [&](ExecutionRecord& r) {
                          r.status      = ExecutionStatus::kFailed;
                          r.retry_count = attempts;
                          r.last_error  = reason;
                        }),
                {AdvanceOutcome::kContinue});
}

StepResult Orchestrator::Invoke(const SagaDefinition& definition, const ExecutionRecord& record, bool compensate) {
  const auto& step = definition.StepAt(record.current_step_index);

  StepCall call;
  call.execution_id    = record.execution_id;
  call.step_index      = record.current_step_index;
  call.idempotency_key = compensate ? CompensateKey(record.execution_id, record.current_step_index) : ExecuteKey(record.execution_id, record.current_step_index);
  try {
    call.context = ParseContext(record.context);
  } catch (const util::InvalidState& e) {
    return StepResult::Terminal(e.what());
  }
  if (compensate) {
    auto rejected         = call.context.find(kRejectedStepKey);
    call.execute_rejected = rejected != call.context.end() && rejected->second == std::to_string(record.current_step_index);
  }

  observability::StepSpanInfo span_info;
  span_info.phase        = compensate ? observability::StepPhase::kCompensate : observability::StepPhase::kExecute;
  span_info.execution_id = record.execution_id;
  span_info.saga_type    = record.saga_type;
  span_info.step         = step.name;
  span_info.step_index   = record.current_step_index;
  span_info.attempt      = static_cast<std::int64_t>(record.retry_count) + 1;
  observability::StepSpan span(span_info);

  StepResult result;
  try {
    result = compensate ? step.compensate(call) : step.execute(call);
  } catch (const std::exception& e) {
    result = StepResult::Retryable(std::string("step threw: ") + e.what());
  } catch (...) {
    result = StepResult::Retryable("step threw a non-standard exception");
  }

  const std::string_view outcome = result.ok() ? "ok" : (result.outcome == StepOutcome::kRetryable ? "retryable" : "terminal");
  if (!result.ok()) span.Fail(outcome, result.message);
  SAGA_LOG_DEBUG(compensate ? "compensate returned" : "execute returned",
                 {ExecutionField(record.execution_id), StringField("step", step.name),
                  StringField("outcome", outcome)});
  return result;
}

// ------------------------------------------------------------------
// Persistence
// ------------------------------------------------------------------

std::optional<ExecutionRecord> Orchestrator::Load(const std::string& execution_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetExecution(*tx, execution_id);
  tx->Commit();
  return record;
}

const SagaDefinition& Orchestrator::Validate(const ExecutionRecord& record) const {
  const auto& definition = registry_->Get(record.saga_type);
  if (definition.StepCount() != record.total_steps) {
    throw util::DefinitionError("execution " + record.execution_id + " recorded " + std::to_string(record.total_steps) + " steps but saga " +
                                record.saga_type + " defines " + std::to_string(definition.StepCount()));
  }
  return definition;
}

std::optional<ExecutionRecord> Orchestrator::Persist(const ExecutionRecord& base, const Mutation& mutate) {
  auto expected = base;
  for (int attempt = 0; attempt < kPersistAttempts; ++attempt) {
    auto next = expected;
    mutate(next);
    if (next.status != expected.status && !saga::model::CanTransition(expected.status, next.status)) {
      throw util::InvalidState("illegal transition " + StatusName(expected.status) + " -> " + StatusName(next.status) + " for execution " +
                               expected.execution_id);
    }
    next.updated_at_ms = util::NowMillis();
    if (saga::model::IsTerminal(next.status)) next.completed_at_ms = next.updated_at_ms;

    {
      auto tx     = repository_->Begin();
      auto result = repository_->UpdateExecution(*tx, next, expected.version);
      if (result) {
        try {
          tx->Commit();
          return next;
        } catch (const util::Conflict& e) {
          SAGA_LOG_DEBUG("commit lost version race", {ExecutionField(expected.execution_id), StringField("error", e.what())});
        }
      } else if (result.code == db::ErrorCode::NotFound) {
        SAGA_LOG_WARN("execution disappeared during write", {ExecutionField(expected.execution_id)});
        return std::nullopt;
      } else if (result.code != db::ErrorCode::Conflict) {
        ThrowIfDbError(result, "update execution " + expected.execution_id);
      }
    }

    auto fresh = Load(expected.execution_id);
    if (!fresh || !SameProgress(*fresh, expected)) {
      SAGA_LOG_INFO("execution advanced by another writer, abandoning", {ExecutionField(expected.execution_id)});
      return std::nullopt;
    }
    expected = *fresh;
  }
  return std::nullopt;
}

AdvanceResult Orchestrator::Finish(const std::optional<ExecutionRecord>& written, AdvanceResult on_success) {
  if (!written) return {AdvanceOutcome::kAbandoned};
  if (saga::model::IsTerminal(written->status)) {
    OnTerminal(*written);
    return {AdvanceOutcome::kTerminal};
  }
  return on_success;
}

void Orchestrator::OnTerminal(const ExecutionRecord& record) {
  if (record.status == ExecutionStatus::kFailed) {
    alerts_->Raise({record.execution_id, record.saga_type, StatusName(record.status), record.last_error});
  }

  SAGA_LOG_INFO("saga finished", {ExecutionField(record.execution_id), StringField("saga_type", record.saga_type),
                                  StringField("status", StatusName(record.status)), IntField("step_index", record.current_step_index),
                                  StringField("failed_step", record.failed_step), StringField("failure_reason", record.failure_reason)});

  if (completion_listener_) completion_listener_(record);
}

} // namespace saga::core
