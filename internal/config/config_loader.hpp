#pragma once

#include <string>

#include "config/config.pb.h"

namespace loyalty::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static loyalty::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document.
  static loyalty::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace loyalty::config
