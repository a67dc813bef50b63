#pragma once

#include <string>

#include "docflow/runtime/config/config.pb.h"

namespace docflow::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected. Quoted scalars always stay strings, so "10.00" or "true"
  reach string fields untouched.
*/
class ConfigLoader {
 public:
  static docflow::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static docflow::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace docflow::config
