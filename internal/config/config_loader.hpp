#pragma once

#include <string>

#include "config/config.pb.h"

namespace repricer::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names
  follow the proto JSON mapping and durations use the "60s" form.
  Unknown fields are rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static repricer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static repricer::runtime::config::RuntimeConfig ParseYaml(const std::string& text);

  // Throws std::invalid_argument on out-of-range engine settings.
  static void Validate(const repricer::runtime::config::RuntimeConfig& config);
};

} // namespace repricer::config
