#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/config/yaml_proto.hpp"
#include "internal/util/errors.hpp"

namespace slideshow::config {

namespace {

slideshow::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  slideshow::runtime::config::RuntimeConfig config;
  try {
    YamlToMessage(yaml, &config);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(e.what()));
  }
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

slideshow::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  return Parse(yaml);
}

slideshow::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Parse(yaml);
}

} // namespace slideshow::config
