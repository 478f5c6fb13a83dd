#pragma once

#include <string>

#include "config/config.pb.h"

namespace fieldlink::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Every failure is reported as util::ConfigError.
*/
class ConfigLoader {
 public:
  static fieldlink::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Schema checks that must hold before any relation is built.
  static void Validate(const fieldlink::runtime::config::RuntimeConfig& config);

  // LoadFromYaml followed by Validate.
  static fieldlink::runtime::config::RuntimeConfig Load(const std::string& path);
};

} // namespace fieldlink::config
