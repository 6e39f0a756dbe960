#pragma once

#include <string>

#include "config/config.pb.h"

namespace progress::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset engine and server fields receive their defaults and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static progress::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static progress::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(progress::runtime::config::RuntimeConfig& config);
  static void Validate(const progress::runtime::config::RuntimeConfig& config);
};

} // namespace progress::config
