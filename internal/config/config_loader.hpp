#pragma once

#include <string>

#include "config/config.pb.h"

namespace osforge::config {

/*
  Reads the server's RuntimeConfig from YAML: server, logging, observability,
  database, pipeline and toolchain sections.

  The document goes YAML -> protobuf Value -> JSON -> RuntimeConfig. Unknown
  keys are an error. Quoted scalars stay strings, so argv entries such as
  "32" are not turned into numbers.
*/
class ConfigLoader {
 public:
  static osforge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml for an in-memory document; used by tests and tooling.
  static osforge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace osforge::config
