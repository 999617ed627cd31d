#include "saga_definition.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace saga::core {

std::string ExecuteKey(const std::string& execution_id, int32_t step_index) {
  return execution_id + "/" + std::to_string(step_index);
}

std::string CompensateKey(const std::string& execution_id, int32_t step_index) {
  return ExecuteKey(execution_id, step_index) + "/undo";
}

SagaDefinition::SagaDefinition(std::string saga_type, std::vector<Step> steps, RetryPolicy retry)
    : saga_type_(std::move(saga_type)), steps_(std::move(steps)), retry_(retry) {
  if (saga_type_.empty()) throw util::DefinitionError("saga type must not be empty");
  if (steps_.empty()) throw util::DefinitionError("saga " + saga_type_ + " has no steps");
  if (retry_.max_attempts == 0) throw util::DefinitionError("saga " + saga_type_ + " retry policy allows zero attempts");

  for (std::size_t i = 0; i < steps_.size(); ++i) {
    const auto& step = steps_[i];
    const auto  where = "saga " + saga_type_ + " step " + std::to_string(i);
    if (step.name.empty()) throw util::DefinitionError(where + " has no name");
    if (!step.execute) throw util::DefinitionError(where + " (" + step.name + ") has no execute");
    if (!step.compensate) throw util::DefinitionError(where + " (" + step.name + ") has no compensate");
  }
}

void SagaRegistry::Register(SagaDefinition definition) {
  if (frozen_) throw util::InvalidState("saga registry is frozen; cannot register " + definition.Type());

  auto type = definition.Type();
  if (definitions_.contains(type)) throw util::AlreadyExists("saga type already registered: " + type);
  definitions_.emplace(std::move(type), std::make_shared<const SagaDefinition>(std::move(definition)));
}

void SagaRegistry::Freeze() {
  frozen_ = true;
}

const SagaDefinition* SagaRegistry::Find(const std::string& saga_type) const {
  auto it = definitions_.find(saga_type);
  return it == definitions_.end() ? nullptr : it->second.get();
}

const SagaDefinition& SagaRegistry::Get(const std::string& saga_type) const {
  if (const auto* definition = Find(saga_type)) return *definition;
  throw util::DefinitionError("unregistered saga type: " + saga_type);
}

std::vector<std::string> SagaRegistry::Types() const {
  std::vector<std::string> types;
  types.reserve(definitions_.size());
  for (const auto& [type, _] : definitions_) types.push_back(type);
  std::sort(types.begin(), types.end());
  return types;
}

} // namespace saga::core
