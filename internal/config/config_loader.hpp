#pragma once

#include <string>

#include "config/config.pb.h"

namespace roipack::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields the file leaves
  out keep their Defaults() value.
*/
class ConfigLoader {
 public:
  static roipack::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static roipack::runtime::config::RuntimeConfig Defaults();

  // Throws std::runtime_error on out-of-range values.
  static void Validate(const roipack::runtime::config::RuntimeConfig& config);
};

} // namespace roipack::config
