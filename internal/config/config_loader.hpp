#pragma once

#include <string>

#include "config/config.pb.h"

namespace roster::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static roster::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills in defaults for fields left empty by the file.
  static void ApplyDefaults(roster::runtime::config::RuntimeConfig& config);
};

} // namespace roster::config
