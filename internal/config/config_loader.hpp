#pragma once

#include <string>

#include "config/config.pb.h"

namespace circulate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static circulate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static circulate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace circulate::config
