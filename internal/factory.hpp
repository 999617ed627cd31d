#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/orchestrator.hpp"
#include "internal/core/retry_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/dispatch/dispatch_queue.hpp"
#include "internal/dispatch/worker_pool.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/observability/alerts.hpp"
#include "internal/recovery/recovery_scanner.hpp"
#include "internal/sagas/create_order_saga.hpp"

namespace saga::factory {

/*
  Application

  Owns all long-lived components of the orchestrator process.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<core::SagaRegistry>         registry;
  std::shared_ptr<lease::LeaseManager>        leases;
  std::shared_ptr<observability::AlertSink>   alerts;
  std::shared_ptr<core::Orchestrator>         orchestrator;
  std::shared_ptr<dispatch::DispatchQueue>    queue;
  std::shared_ptr<dispatch::WorkerPool>       workers;
  std::shared_ptr<recovery::RecoveryScanner>  scanner;
  bool                                        recovery_enabled = true;

  void Start();
  void Stop();
};

/*
  Build

  Composition root. The ONLY place allowed to know concrete DB types.
  Collaborator clients are passed in so tests and tools can supply their
  own; the daemon passes gRPC clients.
*/
Application Build(const saga::runtime::config::RuntimeConfig& config, sagas::CreateOrderClients clients);

std::shared_ptr<db::Repository> BuildRepository(const saga::runtime::config::RuntimeConfig& config);

// Per-saga-type override, else orchestrator.default_retry, else built-in defaults.
core::RetryPolicy ResolveRetryPolicy(const saga::runtime::config::RuntimeConfig& config, const std::string& saga_type);

recovery::RecoveryOptions ResolveRecoveryOptions(const saga::runtime::config::RuntimeConfig& config);

} // namespace saga::factory
