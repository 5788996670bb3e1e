#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset or zero fields are filled with the documented defaults.
  Errors throw util::InvalidArgument.
*/
class ConfigLoader {
 public:
  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fleet::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);

  static void ApplyDefaults(fleet::runtime::config::RuntimeConfig* config);
};

} // namespace fleet::config
