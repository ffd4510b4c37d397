#pragma once

#include <string>

#include "config/config.pb.h"

namespace schemadb::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys and
  malformed documents raise util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static schemadb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static schemadb::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace schemadb::config
