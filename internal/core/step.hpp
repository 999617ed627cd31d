#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace saga::core {

using ContextValues = std::map<std::string, std::string>;

enum class StepOutcome : std::uint8_t {
  kOk,
  kRetryable,
  kTerminal,
};

/*
  What a step call returns.

  - kOk:        fragment is merged into the execution context
  - kRetryable: transient (timeout, unavailable, open circuit); consumes one
                attempt of the retry budget
  - kTerminal:  business rejection; no retry
*/
struct StepResult {
  StepOutcome   outcome = StepOutcome::kOk;
  std::string   message;
  ContextValues fragment;

  static StepResult Ok(ContextValues fragment = {}) {
    return {StepOutcome::kOk, {}, std::move(fragment)};
  }

  static StepResult Retryable(std::string message) {
    return {StepOutcome::kRetryable, std::move(message), {}};
  }

  static StepResult Terminal(std::string message) {
    return {StepOutcome::kTerminal, std::move(message), {}};
  }

  bool ok() const {
    return outcome == StepOutcome::kOk;
  }
};

/*
  Input to one execute or compensate call.

  The context is a copy; steps report changes through StepResult::fragment
  and never hold on to it.
*/
struct StepCall {
  std::string   execution_id;
  int32_t       step_index = 0;
  std::string   idempotency_key;
  ContextValues context;

  // Compensate only: this step's own execute was rejected terminally, so
  // the collaborator applied nothing.
  bool execute_rejected = false;
};

// Context key naming the step index whose execute was rejected terminally.
inline constexpr const char* kRejectedStepKey = "saga.rejected_step";

using StepFn = std::function<StepResult(const StepCall&)>;

/*
  One entry of a saga's function table.

  execute must be idempotent under StepCall::idempotency_key. compensate
  must be idempotent and safe when execute never ran or only partially
  applied; steps with nothing to undo return StepResult::Ok().
*/
struct Step {
  std::string name;
  StepFn      execute;
  StepFn      compensate;
};

// "<execution_id>/<step_index>" for execute, with "/undo" appended for compensate.
std::string ExecuteKey(const std::string& execution_id, int32_t step_index);
std::string CompensateKey(const std::string& execution_id, int32_t step_index);

} // namespace saga::core
