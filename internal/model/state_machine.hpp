#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace saga::model {

enum class ExecutionStatus : std::uint8_t {
  kStarted      = 0,
  kInProgress   = 1,
  kCompensating = 2,
  kCompensated  = 3,
  kCompleted    = 4,
  kFailed       = 5,
};

constexpr bool IsTerminal(ExecutionStatus status) {
  return status == ExecutionStatus::kCompleted || status == ExecutionStatus::kCompensated || status == ExecutionStatus::kFailed;
}

/*
  Saga state machine.

    STARTED      -> IN_PROGRESS
    IN_PROGRESS  -> IN_PROGRESS | COMPLETED | COMPENSATING
    COMPENSATING -> COMPENSATING | COMPENSATED | FAILED

  Terminal states never transition.
*/
constexpr bool CanTransition(ExecutionStatus from, ExecutionStatus to) {
  switch (from) {
    case ExecutionStatus::kStarted:
      return to == ExecutionStatus::kInProgress;
    case ExecutionStatus::kInProgress:
      return to == ExecutionStatus::kInProgress || to == ExecutionStatus::kCompleted || to == ExecutionStatus::kCompensating;
    case ExecutionStatus::kCompensating:
      return to == ExecutionStatus::kCompensating || to == ExecutionStatus::kCompensated || to == ExecutionStatus::kFailed;
    default:
      return false;
  }
}

constexpr std::string_view ToString(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::kStarted:
      return "STARTED";
    case ExecutionStatus::kInProgress:
      return "IN_PROGRESS";
    case ExecutionStatus::kCompensating:
      return "COMPENSATING";
    case ExecutionStatus::kCompensated:
      return "COMPENSATED";
    case ExecutionStatus::kCompleted:
      return "COMPLETED";
    case ExecutionStatus::kFailed:
      return "FAILED";
  }
  return "UNKNOWN";
}

constexpr std::optional<ExecutionStatus> ParseStatus(std::string_view text) {
  for (auto status : {ExecutionStatus::kStarted, ExecutionStatus::kInProgress, ExecutionStatus::kCompensating, ExecutionStatus::kCompensated,
                      ExecutionStatus::kCompleted, ExecutionStatus::kFailed}) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

// Index value left on a fully compensated execution.
inline constexpr int32_t kCompensatedIndex = -1;

} // namespace saga::model
