#include "remote_call.hpp"

#include <exception>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace saga::remote {

using observability::IntField;
using observability::StringField;

CallOutcome Classify(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::OK:
      return CallOutcome::kOk;
    case grpc::StatusCode::DEADLINE_EXCEEDED:
    case grpc::StatusCode::UNAVAILABLE:
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
    case grpc::StatusCode::ABORTED:
    case grpc::StatusCode::UNKNOWN:
    case grpc::StatusCode::INTERNAL:
    case grpc::StatusCode::CANCELLED:
      return CallOutcome::kRetryable;
    default:
      return CallOutcome::kTerminal;
  }
}

CallResult CallResult::FromStatus(const grpc::Status& status) {
  return {Classify(status.error_code()), status.error_code(), status.error_message()};
}

CallResult CallResult::CircuitOpen(const std::string& target) {
  return {CallOutcome::kRetryable, grpc::StatusCode::UNAVAILABLE, "circuit open for " + target};
}

RemoteCaller::RemoteCaller(std::string target, RemoteCallOptions options, std::shared_ptr<CircuitBreaker> breaker)
    : target_(std::move(target)), options_(options), breaker_(std::move(breaker)) {
}

std::unique_ptr<RemoteCaller> RemoteCaller::FromConfig(std::string target, const saga::runtime::config::CollaboratorConfig& config) {
  RemoteCallOptions options;
  options.timeout = util::ToMillis(config.call_timeout(), options.timeout);
  return std::make_unique<RemoteCaller>(std::move(target), options,
                                        std::make_shared<CircuitBreaker>(CircuitBreakerOptions::FromConfig(config.circuit_breaker())));
}

CallResult RemoteCaller::Call(const std::string& method, const Invoke& invoke) {
  if (!breaker_->TryAcquire()) {
    SAGA_LOG_DEBUG("call short-circuited", {StringField("target", target_), StringField("method", method)});
    return CallResult::CircuitOpen(target_);
  }

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + options_.timeout);

  grpc::Status status;
  try {
    status = invoke(context);
  } catch (const std::exception& e) {
    // an admitted call that never produced a status still settles its breaker slot
    breaker_->OnFailure();
    SAGA_LOG_WARN("collaborator call threw", {StringField("target", target_), StringField("method", method), StringField("error", e.what()),
                                              StringField("circuit", ToString(breaker_->GetState()))});
    throw;
  }
  auto result = CallResult::FromStatus(status);

  if (result.outcome == CallOutcome::kRetryable) {
    breaker_->OnFailure();
    SAGA_LOG_WARN("collaborator call failed", {StringField("target", target_), StringField("method", method),
                                               IntField("code", static_cast<int64_t>(result.code)), StringField("error", result.message),
                                               StringField("circuit", ToString(breaker_->GetState()))});
  } else {
    breaker_->OnSuccess();
  }
  return result;
}

} // namespace saga::remote
