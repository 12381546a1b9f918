#pragma once

#include <string>

#include "config/config.pb.h"

namespace relcache::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static relcache::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Cross-field checks the proto schema cannot express. Throws std::runtime_error.
  static void Validate(const relcache::runtime::config::RuntimeConfig& config);
};

} // namespace relcache::config
