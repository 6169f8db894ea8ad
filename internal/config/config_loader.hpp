#pragma once

#include <string>

#include "config/config.pb.h"

namespace komorebi::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static komorebi::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is supplied.
  static komorebi::runtime::config::RuntimeConfig Defaults();
};

} // namespace komorebi::config
