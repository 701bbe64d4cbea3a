#pragma once

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <yaml-cpp/yaml.h>

namespace slideshow::config {

/*
  YAML -> protobuf bridge shared by the config and pool loaders.

  The YAML tree is converted to a google.protobuf.Value, rendered as JSON and
  parsed into the target message with unknown fields rejected. Plain scalars
  that look like numbers or booleans become numbers/booleans; quoted scalars
  always stay strings.

  Throws std::runtime_error on unsupported nodes or messages that do not
  match the schema.
*/
google::protobuf::Value YamlToProtoValue(const YAML::Node& node);

void YamlToMessage(const YAML::Node& node, google::protobuf::Message* message);

} // namespace slideshow::config
