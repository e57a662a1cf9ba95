#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using gemfeed::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "gemfeed_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestSqliteSectionIsParsed() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(database:
  sqlite:
    path: "/var/lib/gemfeed/gemfeed.db"
    wal_mode: true
    busy_timeout_ms: 2500
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/gemfeed/gemfeed.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\gemfeed\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");
  assert(config.database().sqlite().path() == "C:\\gemfeed\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "123"
)");
  assert(config.logging().pattern() == "123");
}

void TestPostgresAndMemorySections() {
  auto pg = ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://gemfeed@localhost/gemfeed"
    max_connections: 4
)");
  assert(pg.database().has_postgres());
  assert(pg.database().postgres().connection_uri() == "postgresql://gemfeed@localhost/gemfeed");
  assert(pg.database().postgres().max_connections() == 4);

  auto memory = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(memory.database().has_memory());
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_database());
  assert(config.logging().level().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/gemfeed/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestDatabaseUrlOverrides() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "/tmp/from-file.db"
    wal_mode: true
    busy_timeout_ms: 100
)");

  ConfigLoader::ApplyDatabaseUrl(config, "sqlite:///tmp/override.db");
  assert(config.database().sqlite().path() == "/tmp/override.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 100);

  ConfigLoader::ApplyDatabaseUrl(config, "postgres://localhost/gemfeed");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgres://localhost/gemfeed");

  ConfigLoader::ApplyDatabaseUrl(config, "memory://");
  assert(config.database().has_memory());

  bool threw = false;
  try {
    ConfigLoader::ApplyDatabaseUrl(config, "mysql://localhost/gemfeed");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ConfigLoader::ApplyDatabaseUrl(config, "sqlite://");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEnvironmentTakesPrecedence() {
  auto config = ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");

  setenv("GEMFEED_DATABASE_URL", "sqlite:///tmp/env.db", 1);
  ConfigLoader::ApplyEnvironmentOverrides(config);
  unsetenv("GEMFEED_DATABASE_URL");

  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/env.db");
}

} // namespace

int main() {
  TestSqliteSectionIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestPostgresAndMemorySections();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestDatabaseUrlOverrides();
  TestEnvironmentTakesPrecedence();

  std::cout << "gemfeed_unit_config_loader: pass\n";
  return 0;
}
