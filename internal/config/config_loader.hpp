#pragma once

#include <string>

#include "config/config.pb.h"

namespace gemfeed::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown
  keys and mistyped values are rejected by the message schema.
*/
class ConfigLoader {
 public:
  static gemfeed::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same as LoadFromYaml, for configuration held in memory.
  static gemfeed::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  /*
    Environment overrides:
      GEMFEED_DATABASE_URL  sqlite://<path> | postgres://... | postgresql://... | memory://
    Logging overrides are resolved in InitializeLogging.
  */
  static void ApplyEnvironmentOverrides(gemfeed::runtime::config::RuntimeConfig& config);

  // Replaces config.database with the backend named by a database URL.
  static void ApplyDatabaseUrl(gemfeed::runtime::config::RuntimeConfig& config, const std::string& url);
};

} // namespace gemfeed::config
