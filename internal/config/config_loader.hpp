#pragma once

#include <string>

#include "config/config.pb.h"

namespace jwlmerge::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields the file
  leaves unset take the values from Defaults(); out-of-range values throw.
*/
class ConfigLoader {
 public:
  static jwlmerge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static jwlmerge::runtime::config::RuntimeConfig Defaults();

  // Fills unset fields from Defaults() and validates ranges.
  static void Finalize(jwlmerge::runtime::config::RuntimeConfig* config);
};

} // namespace jwlmerge::config
