#pragma once

#include <string>

#include "config/config.pb.h"

namespace tracksync::config {

/*
  Reads RuntimeConfig from a YAML file.

  The YAML tree goes through google::protobuf::Value and JSON into the
  message, so unknown keys fail like unknown JSON fields. Every failure
  is a util::ValidationError naming the file.
*/
class ConfigLoader {
 public:
  static tracksync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills zero-valued tuning knobs with the defaults the engines expect.
  static void ApplyDefaults(tracksync::runtime::config::RuntimeConfig& config);
};

} // namespace tracksync::config
