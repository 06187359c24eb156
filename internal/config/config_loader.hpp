#pragma once

#include <string>

#include "config/config.pb.h"

namespace handoff::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing sections are filled with defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static handoff::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static handoff::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Defaults: bind 0.0.0.0:50051, memory database, scheduler enabled
  // with a 60s tick and 5m settings cache.
  static void ApplyDefaults(handoff::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error describing the first invalid field.
  static void Validate(const handoff::runtime::config::RuntimeConfig& config);
};

} // namespace handoff::config
