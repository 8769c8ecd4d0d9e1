#pragma once

#include <string>

#include "config/config.pb.h"

namespace rentledger::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Quoted scalars stay
  strings, so principals that look numeric survive.
*/
class ConfigLoader {
 public:
  static rentledger::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static rentledger::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);
};

} // namespace rentledger::config
