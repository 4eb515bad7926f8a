#pragma once

#include <string>

#include "config/config.pb.h"

namespace uploader::config {

using RuntimeConfig = uploader::runtime::config::RuntimeConfig;

/*
  Reads the uploader's YAML configuration.

  The YAML tree is re-encoded as JSON and parsed into RuntimeConfig, so
  the proto schema is the single source of field names. Unknown keys are
  rejected; a misspelled knob must not silently fall back to a default.

  Every loader returns a config that already went through ApplyDefaults()
  and Validate().
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);
  static RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  // Zero-valued knobs get the engine defaults.
  static void ApplyDefaults(RuntimeConfig* config);

  // Throws std::invalid_argument naming the offending key.
  static void Validate(const RuntimeConfig& config);
};

} // namespace uploader::config
