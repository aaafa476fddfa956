#pragma once

#include <string>

#include "config/config.pb.h"

namespace ducksql::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names follow
  config.proto and unknown keys are rejected. Quoted scalars always stay
  strings; unquoted ones are read as bool / number when they look like one.
*/
class ConfigLoader {
 public:
  static ducksql::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static ducksql::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace ducksql::config
