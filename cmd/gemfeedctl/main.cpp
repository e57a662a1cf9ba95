#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && args.empty()) {
      if (i + 1 >= argc) {
        gemfeed::cli::PrintUsage(std::cout);
        return 1;
      }
      config_path = argv[++i];
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      gemfeed::cli::PrintUsage(std::cout);
      return 0;
    }
    args.push_back(arg);
  }

  if (args.empty()) {
    gemfeed::cli::PrintUsage(std::cout);
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    gemfeed::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = gemfeed::config::ConfigLoader::LoadFromYaml(config_path);
    }
    gemfeed::config::ConfigLoader::ApplyEnvironmentOverrides(config);

    gemfeed::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = gemfeed::factory::Build(config);

    const int rc = gemfeed::cli::RunCommand(*app, args, std::cout, std::cerr);
    gemfeed::observability::ShutdownLogging();
    return rc;
  } catch (const gemfeed::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    gemfeed::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    GEMFEED_LOG_ERROR("Fatal error", {gemfeed::observability::StringField("error", e.what())});
    gemfeed::observability::ShutdownLogging();
    return 2;
  }
}
