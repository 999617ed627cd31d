#pragma once

#include <string>

#include "config/config.pb.h"

namespace saga::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a google.protobuf.Value, printed as JSON and parsed
  into the protobuf message. Unknown keys are rejected. Durations use the
  protobuf JSON form ("250ms" is not valid; write "0.250s").
*/
class ConfigLoader {
 public:
  static saga::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static saga::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Semantic checks the schema cannot express. Throws std::invalid_argument.
  static void Validate(const saga::runtime::config::RuntimeConfig& config);
};

} // namespace saga::config
