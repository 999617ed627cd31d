#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/collaborators/grpc_clients.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using saga::observability::BoolField;
using saga::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownObservability() {
  saga::observability::ShutdownLogging();
  saga::observability::ShutdownTracing();
}

int Usage() {
  std::cerr << "Usage: saga-orchestrator [--check] <config.yaml>\n"
               "       saga-orchestrator [--check] --config <config.yaml>\n"
               "  --check  validate the configuration and exit\n";
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  bool        check_only = false;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check") {
      check_only = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      return Usage();
    }
  }
  if (config_path.empty()) return Usage();

  try {
    auto config = saga::config::ConfigLoader::LoadFromYaml(config_path);
    if (check_only) {
      std::cout << config_path << ": ok\n";
      return 0;
    }

    saga::observability::InitializeTracing(config);
    saga::observability::InitializeLogging(config);

    auto app = saga::factory::Build(config, saga::collaborators::BuildGrpcClients(config.collaborators()));

    // handlers go in before workers start so an early SIGTERM still drains
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    SAGA_LOG_INFO("saga orchestrator started",
                  {StringField("config", config_path), BoolField("recovery_enabled", app.recovery_enabled)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SAGA_LOG_INFO("saga orchestrator stopping");
    app.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    if (check_only) {
      std::cerr << config_path << ": " << e.what() << "\n";
      return 2;
    }
    SAGA_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
