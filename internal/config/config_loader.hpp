#pragma once

#include <string>

#include "config/config.pb.h"

namespace awacs::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected so typos surface at startup instead of silently using defaults.
*/
class ConfigLoader {
 public:
  static awacs::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static awacs::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace awacs::config
