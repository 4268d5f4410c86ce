#pragma once

#include <string>

#include "config/config.pb.h"

namespace ctxsync::config {

using ctxsync::runtime::config::RuntimeConfig;

// YAML -> JSON -> RuntimeConfig. Unknown keys fail the JSON parse; the
// result then goes through Validate() before it is returned.
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);
  static RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Cross-field rules the proto schema cannot express: disjoint field
  // authority, a reachable backend for every enabled tier and producer, and
  // a hit-rate target within [0, 1]. Throws util::ValidationError.
  static void Validate(const RuntimeConfig& config);
};

} // namespace ctxsync::config
