#pragma once

#include <string>

#include "config/config.pb.h"

namespace slideshow::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Any failure is
  reported as util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static slideshow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static slideshow::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace slideshow::config
