#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace gemfeed::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static gemfeed::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  gemfeed::runtime::config::RuntimeConfig config;

  // an empty document means all defaults
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

gemfeed::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

gemfeed::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::ApplyEnvironmentOverrides(gemfeed::runtime::config::RuntimeConfig& config) {
  if (const char* url = std::getenv("GEMFEED_DATABASE_URL")) {
    if (*url != '\0') {
      ApplyDatabaseUrl(config, url);
    }
  }
}

void ConfigLoader::ApplyDatabaseUrl(gemfeed::runtime::config::RuntimeConfig& config, const std::string& url) {
  static constexpr std::string_view kSqlite = "sqlite://";
  static constexpr std::string_view kMemory = "memory://";

  auto* database = config.mutable_database();

  if (url.starts_with(kSqlite)) {
    const auto path = url.substr(kSqlite.size());
    if (path.empty()) {
      throw std::runtime_error("Invalid database url: sqlite:// requires a file path");
    }
    // keep tuning knobs from the file when only the location moves
    const bool     wal_mode     = database->has_sqlite() ? database->sqlite().wal_mode() : true;
    const uint32_t busy_timeout = database->has_sqlite() ? database->sqlite().busy_timeout_ms() : 0;
    auto*          sqlite       = database->mutable_sqlite();
    sqlite->set_path(path);
    sqlite->set_wal_mode(wal_mode);
    sqlite->set_busy_timeout_ms(busy_timeout);
    return;
  }

  if (url.starts_with("postgres://") || url.starts_with("postgresql://")) {
    const uint32_t max_connections = database->has_postgres() ? database->postgres().max_connections() : 0;
    auto*          postgres        = database->mutable_postgres();
    postgres->set_connection_uri(url);
    postgres->set_max_connections(max_connections);
    return;
  }

  if (url.starts_with(kMemory)) {
    database->mutable_memory();
    return;
  }

  throw std::runtime_error("Invalid database url: unsupported scheme in '" + url + "'");
}

} // namespace gemfeed::config
