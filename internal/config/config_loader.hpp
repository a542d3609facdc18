#pragma once

#include <string>

#include "config/config.pb.h"

namespace cookiesession::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Failures throw util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static cookiesession::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static cookiesession::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& text);
};

} // namespace cookiesession::config
