#pragma once

#include <optional>
#include <string>

#include "step.hpp"

namespace saga::core {

/*
  Execution context <-> persisted blob.

  The blob is the protobuf JSON form of saga.orchestrator.v1.SagaContext.
*/
std::string SerializeContext(const ContextValues& values);

// Throws util::InvalidState on a blob that does not parse.
ContextValues ParseContext(const std::string& blob);

// nullopt instead of throwing.
std::optional<ContextValues> TryParseContext(const std::string& blob);

// Fragment keys overwrite existing keys.
void MergeFragment(ContextValues& values, const ContextValues& fragment);

} // namespace saga::core
