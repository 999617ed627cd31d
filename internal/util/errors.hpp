#pragma once

#include <stdexcept>
#include <string>

namespace saga::util {

/*
  Errors raised by the orchestrator's public operations (Start, GetStatus,
  Cancel, Resume, Drive) and by saga registration.

  A failing step is not one of these: step outcomes are StepResult values
  and only change the persisted execution record.
*/
class SagaError : public std::runtime_error {
 public:
  explicit SagaError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No execution with the requested id.
class NotFound : public SagaError {
 public:
  explicit NotFound(const std::string& msg) : SagaError(msg) {
  }
};

// Execution id collision on insert.
class AlreadyExists : public SagaError {
 public:
  explicit AlreadyExists(const std::string& msg) : SagaError(msg) {
  }
};

// Operation not valid for the execution's current state, or context that
// cannot be decoded.
class InvalidState : public SagaError {
 public:
  explicit InvalidState(const std::string& msg) : SagaError(msg) {
  }
};

// Optimistic version check lost against a concurrent writer.
class Conflict : public SagaError {
 public:
  explicit Conflict(const std::string& msg) : SagaError(msg) {
  }
};

// Unregistered saga type or a definition that no longer matches a persisted record.
class DefinitionError : public SagaError {
 public:
  explicit DefinitionError(const std::string& msg) : SagaError(msg) {
  }
};

} // namespace saga::util
