#pragma once

#include <string>

#include "config/config.pb.h"

namespace hive::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unknown fields and out-of-range values throw util::StartupError.
*/
class ConfigLoader {
 public:
  static hive::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void Validate(const hive::runtime::config::RuntimeConfig& config);
};

} // namespace hive::config
