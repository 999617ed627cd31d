#pragma once

#include <grpcpp/support/status.h>

#include <cstdint>
#include <string>

namespace saga::remote {

enum class CallOutcome : std::uint8_t {
  kOk,
  kRetryable,
  kTerminal,
};

/*
  Classified outcome of one collaborator call.

  code keeps the raw gRPC status so callers can tolerate specific business
  answers (NOT_FOUND on release, ALREADY_EXISTS on refund).
*/
struct CallResult {
  CallOutcome     outcome = CallOutcome::kOk;
  grpc::StatusCode code   = grpc::StatusCode::OK;
  std::string     message;

  bool ok() const {
    return outcome == CallOutcome::kOk;
  }

  bool Is(grpc::StatusCode c) const {
    return code == c;
  }

  static CallResult FromStatus(const grpc::Status& status);

  static CallResult CircuitOpen(const std::string& target);
};

// Retryable codes also count as circuit breaker failures; terminal codes
// (business rejections, bad requests) never do.
CallOutcome Classify(grpc::StatusCode code);

} // namespace saga::remote
