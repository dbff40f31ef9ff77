#pragma once

#include <string>

#include "config/config.pb.h"

namespace shopstack::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset sections are
  filled with the storefront defaults (products/orders/cart, default build
  commands, stage timeouts).
*/
class ConfigLoader {
 public:
  static shopstack::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static shopstack::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  static void ApplyDefaults(shopstack::runtime::config::RuntimeConfig& config);
  static void Validate(const shopstack::runtime::config::RuntimeConfig& config);
};

} // namespace shopstack::config
