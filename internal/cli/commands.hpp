#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "internal/factory.hpp"

namespace gemfeed::cli {

void PrintUsage(std::ostream& out);

/*
  RunCommand

  Executes one gemfeedctl subcommand against a built application.
  args[0] is the subcommand. Results go to out, refusals to err.

  Returns the process exit code: 0 on success, 1 on a usage error or a
  refused setup. Store exceptions propagate to the caller.
*/
int RunCommand(factory::Application& app, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err);

} // namespace gemfeed::cli
