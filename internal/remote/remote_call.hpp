#pragma once

#include <grpcpp/client_context.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "call_result.hpp"
#include "circuit_breaker.hpp"

namespace saga::runtime::config {
class CollaboratorConfig;
}

namespace saga::remote {

struct RemoteCallOptions {
  std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

/*
  Single-attempt wrapper for outbound collaborator calls.

  Applies a gRPC deadline, consults the collaborator's circuit breaker and
  classifies the status. Retrying is the orchestrator's job.
*/
class RemoteCaller {
 public:
  using Invoke = std::function<grpc::Status(grpc::ClientContext&)>;

  RemoteCaller(std::string target, RemoteCallOptions options, std::shared_ptr<CircuitBreaker> breaker);

  static std::unique_ptr<RemoteCaller> FromConfig(std::string target, const saga::runtime::config::CollaboratorConfig& config);

  CallResult Call(const std::string& method, const Invoke& invoke);

  CircuitBreaker& Breaker() {
    return *breaker_;
  }

  const std::string& Target() const {
    return target_;
  }

 private:
  std::string                     target_;
  RemoteCallOptions               options_;
  std::shared_ptr<CircuitBreaker> breaker_;
};

} // namespace saga::remote
