#pragma once

#include <string>

#include "config/config.pb.h"

namespace dbtarget::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected by the protobuf JSON parser. Missing target settings are filled
  with defaults; a config without a database section is invalid.
*/
class ConfigLoader {
 public:
  static dbtarget::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static dbtarget::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml_text);

  static constexpr const char* kDefaultTargetName   = "dbtarget";
  static constexpr unsigned    kDefaultMaxBatchSize = 512;
};

} // namespace dbtarget::config
