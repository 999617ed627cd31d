#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace saga::util {

/*
  Random identifiers for executions, leases and orchestrator instances.
  RFC4122 version 4, rendered in the canonical 8-4-4-4-12 form.
*/

using UUID = std::array<uint8_t, 16>;

UUID        GenerateUUID();
std::string ToString(const UUID& id);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace saga::util
