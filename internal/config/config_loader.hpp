#pragma once

#include <string>

#include "config/config.pb.h"

namespace modelreg::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields absent from the
  file are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static modelreg::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Registry rooted at ./models, disk storage, fsync on, 5s lock timeout.
  static modelreg::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(modelreg::runtime::config::RuntimeConfig& config);
};

} // namespace modelreg::config
