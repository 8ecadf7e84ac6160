#pragma once

#include <string>

#include "config/config.pb.h"

namespace pipeline::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults are filled in after parsing and the result is
  validated, so callers only ever see a complete, consistent config.
  Every failure is a std::runtime_error starting "Invalid configuration:"
  or "Failed to load YAML config:".
*/
class ConfigLoader {
 public:
  static pipeline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static pipeline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(pipeline::runtime::config::RuntimeConfig& config);

  static void Validate(const pipeline::runtime::config::RuntimeConfig& config);
};

} // namespace pipeline::config
