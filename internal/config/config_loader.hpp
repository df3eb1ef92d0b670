#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobq::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Sections missing from the file keep the values from Defaults().
*/
class ConfigLoader {
 public:
  static jobq::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in configuration used when no file is given.
  static jobq::runtime::config::RuntimeConfig Defaults();
};

} // namespace jobq::config
