#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/retry_policy.hpp"
#include "internal/remote/circuit_breaker.hpp"

namespace {

using saga::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "saga_orchestrator_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  alert_log_path: "/tmp/saga-alerts.log"
database:
  sqlite:
    path: "/var/lib/saga/saga.db"
    wal_mode: true
orchestrator:
  worker_threads: 4
  lease_ttl: 30s
  default_retry:
    max_attempts: 5
    initial_backoff: 0.250s
    multiplier: 2
    max_backoff: 5s
  saga_retry:
    CreateOrderSaga:
      max_attempts: 3
recovery:
  enabled: true
  interval: 30s
  stale_after: 60s
  alert_after: 1800s
  batch_limit: 50
collaborators:
  payment:
    endpoint: "payment:50051"
    call_timeout: 2s
    circuit_breaker:
      failure_rate_threshold: 50
      sliding_window_size: 10
      minimum_calls: 5
      open_cooldown: 30s
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/saga/saga.db");
  assert(config.orchestrator().worker_threads() == 4);
  assert(config.orchestrator().default_retry().initial_backoff().nanos() == 250000000);
  assert(config.orchestrator().saga_retry().at("CreateOrderSaga").max_attempts() == 3);
  assert(config.recovery().batch_limit() == 50);
  assert(config.collaborators().payment().endpoint() == "payment:50051");

  const auto retry = saga::core::RetryPolicy::FromConfig(config.orchestrator().default_retry(), {});
  assert(retry.initial_backoff == std::chrono::milliseconds(250));
  assert(retry.max_backoff == std::chrono::milliseconds(5000));

  const auto breaker = saga::remote::CircuitBreakerOptions::FromConfig(config.collaborators().payment().circuit_breaker());
  assert(breaker.minimum_calls == 5);
  assert(breaker.open_cooldown == std::chrono::seconds(30));
}

void TestQuotedScalarsStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(collaborators:
  order:
    endpoint: "8080"
logging:
  pattern: "C:\\logs\\\"quoted\" line1\nline2"
)");
  assert(config.collaborators().order().endpoint() == "8080");
  assert(config.logging().pattern() == "C:\\logs\\\"quoted\" line1\nline2");
}

void TestEmptyDocumentYieldsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_orchestrator());
  assert(config.database().backend_case() == saga::runtime::config::DatabaseConfig::BACKEND_NOT_SET);
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(orchestrator:
  worker_threads: 2
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMillisecondDurationSyntaxIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(orchestrator:
  lease_ttl: 250ms
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestSemanticValidation() {
  const char* invalid[] = {
      "orchestrator:\n  default_retry:\n    multiplier: 0.5\n",
      "orchestrator:\n  default_retry:\n    initial_backoff: 10s\n    max_backoff: 1s\n",
      "recovery:\n  stale_after: 60s\n  alert_after: 30s\n",
      "database:\n  sqlite:\n    wal_mode: true\n",
      "database:\n  postgres:\n    max_connections: 4\n",
      "collaborators:\n  inventory:\n    circuit_breaker:\n      failure_rate_threshold: 150\n",
      "collaborators:\n  inventory:\n    circuit_breaker:\n      sliding_window_size: 5\n      minimum_calls: 8\n",
  };

  for (const auto* yaml : invalid) {
    bool threw = false;
    try {
      (void)ConfigLoader::LoadFromYamlString(yaml);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  // a memory backend needs no settings
  const auto config = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(config.database().has_memory());
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMillisecondDurationSyntaxIsRejected();
  TestSemanticValidation();

  std::cout << "saga_orchestrator_unit_config_loader: pass\n";
  return 0;
}
