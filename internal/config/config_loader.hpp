#pragma once

#include <string>

#include "config/config.pb.h"

namespace trackmatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset fields are
  filled from built-in defaults and the result is validated; any problem
  is reported as std::runtime_error and is fatal at startup.

  TRACKMATCH_SLSKD_API_KEY overrides provider.api_key.
*/
class ConfigLoader {
 public:
  static trackmatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in defaults for every section except provider credentials.
  static trackmatch::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(trackmatch::runtime::config::RuntimeConfig& config);
  static void Validate(const trackmatch::runtime::config::RuntimeConfig& config);
};

} // namespace trackmatch::config
