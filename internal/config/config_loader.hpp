#pragma once

#include <string>

#include "config/config.pb.h"

namespace quotecast::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Throws std::runtime_error with the offending detail.
*/
class ConfigLoader {
 public:
  static quotecast::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace quotecast::config
