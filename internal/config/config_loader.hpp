#pragma once

#include <string>

#include "config/config.pb.h"

namespace google::protobuf {
class Message;
}

namespace labfleet::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. The same path is used
  for the static address plan and script job files, which are YAML (or JSON,
  being a YAML subset) documents with their own message types.
*/
class ConfigLoader {
 public:
  static labfleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Unknown fields are rejected. Throws NotFound or ParseError.
  static void LoadMessageFromYaml(const std::string& path, google::protobuf::Message* message);

  // Fills every zero/empty setting with its built-in default.
  static void ApplyDefaults(labfleet::runtime::config::RuntimeConfig* config);
};

} // namespace labfleet::config
