#pragma once

#include <string>

#include "config/config.pb.h"

namespace feedstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the schema in
  config.proto is the single source of truth. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static feedstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static feedstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Throws std::invalid_argument when the store section cannot be built.
void ValidateConfig(const feedstore::runtime::config::RuntimeConfig& config);

} // namespace feedstore::config
