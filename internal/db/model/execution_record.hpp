#pragma once

#include <cstdint>
#include <string>

#include "internal/model/state_machine.hpp"

namespace saga::db::model {

/*
  Persistent saga execution row.

  IMPORTANT:
  - This is the authoritative record used for recovery.
  - Version is the optimistic concurrency token. Every committed write
    increments it by exactly one; writers state the version they read.
  - context is the serialized SagaContext (protobuf JSON).
*/

struct ExecutionRecord {
  std::string execution_id;
  std::string saga_type;

  saga::model::ExecutionStatus status = saga::model::ExecutionStatus::kStarted;

  // Next step to execute (IN_PROGRESS) or to compensate (COMPENSATING).
  int32_t current_step_index = 0;
  int32_t total_steps        = 0;

  std::string context;

  uint32_t    retry_count = 0;
  std::string last_error;

  // Business failure that started compensation.
  std::string failed_step;
  std::string failure_reason;

  bool cancel_requested = false;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t completed_at_ms = 0; // 0 = not terminal

  uint64_t version = 0;
};

} // namespace saga::db::model
