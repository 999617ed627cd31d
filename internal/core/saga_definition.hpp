#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "retry_policy.hpp"
#include "step.hpp"

namespace saga::core {

/*
  Immutable, ordered list of steps for one saga type.

  Steps run forward in index order and compensate in reverse.
*/
class SagaDefinition {
 public:
  // Throws util::DefinitionError on an empty type, no steps, an unnamed
  // step or a missing execute/compensate callable.
  SagaDefinition(std::string saga_type, std::vector<Step> steps, RetryPolicy retry = {});

  const std::string& Type() const {
    return saga_type_;
  }

  const std::vector<Step>& Steps() const {
    return steps_;
  }

  int32_t StepCount() const {
    return static_cast<int32_t>(steps_.size());
  }

  const Step& StepAt(int32_t index) const {
    return steps_.at(static_cast<std::size_t>(index));
  }

  const RetryPolicy& Retry() const {
    return retry_;
  }

 private:
  std::string       saga_type_;
  std::vector<Step> steps_;
  RetryPolicy       retry_;
};

/*
  Write-once registry of saga definitions.

  Populated at startup, then frozen. After Freeze() the map never changes,
  so lookups take no lock.
*/
class SagaRegistry {
 public:
  // Throws util::AlreadyExists on a duplicate type, util::InvalidState once frozen.
  void Register(SagaDefinition definition);

  void Freeze();

  bool Frozen() const {
    return frozen_;
  }

  // nullptr when the type is not registered.
  const SagaDefinition* Find(const std::string& saga_type) const;

  // Throws util::DefinitionError when the type is not registered.
  const SagaDefinition& Get(const std::string& saga_type) const;

  std::vector<std::string> Types() const;

 private:
  bool frozen_ = false;

  std::unordered_map<std::string, std::shared_ptr<const SagaDefinition>> definitions_;
};

} // namespace saga::core
