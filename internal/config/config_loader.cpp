#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace saga::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars ("8080", "true") stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

saga::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  saga::runtime::config::RuntimeConfig config;
  if (!yaml.IsDefined() || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

int64_t Millis(const google::protobuf::Duration& d) {
  return d.seconds() * 1000 + d.nanos() / 1000000;
}

void ValidateBreaker(const std::string& name, const saga::runtime::config::CollaboratorConfig& collaborator) {
  const auto& breaker = collaborator.circuit_breaker();
  if (breaker.failure_rate_threshold() < 0 || breaker.failure_rate_threshold() > 100) {
    throw std::invalid_argument("collaborators." + name + ".circuit_breaker.failure_rate_threshold must be within [0, 100]");
  }
  if (breaker.sliding_window_size() > 0 && breaker.minimum_calls() > breaker.sliding_window_size()) {
    throw std::invalid_argument("collaborators." + name + ".circuit_breaker.minimum_calls exceeds sliding_window_size");
  }
  if (Millis(collaborator.call_timeout()) < 0) {
    throw std::invalid_argument("collaborators." + name + ".call_timeout must not be negative");
  }
}

void ValidateRetry(const std::string& name, const saga::runtime::config::RetryConfig& retry) {
  if (retry.multiplier() != 0 && retry.multiplier() < 1.0) {
    throw std::invalid_argument(name + ".multiplier must be >= 1");
  }
  if (retry.has_initial_backoff() && retry.has_max_backoff() && Millis(retry.max_backoff()) < Millis(retry.initial_backoff())) {
    throw std::invalid_argument(name + ".max_backoff is shorter than initial_backoff");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

saga::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

saga::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const saga::runtime::config::RuntimeConfig& config) {
  ValidateRetry("orchestrator.default_retry", config.orchestrator().default_retry());
  for (const auto& [saga_type, retry] : config.orchestrator().saga_retry()) {
    ValidateRetry("orchestrator.saga_retry." + saga_type, retry);
  }

  const auto& recovery = config.recovery();
  if (recovery.has_stale_after() && recovery.has_alert_after() && Millis(recovery.alert_after()) <= Millis(recovery.stale_after())) {
    throw std::invalid_argument("recovery.alert_after must be longer than recovery.stale_after");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::invalid_argument("database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::invalid_argument("database.postgres.connection_uri is required");
  }

  ValidateBreaker("inventory", config.collaborators().inventory());
  ValidateBreaker("payment", config.collaborators().payment());
  ValidateBreaker("order", config.collaborators().order());
}

} // namespace saga::config
