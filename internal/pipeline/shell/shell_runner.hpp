#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/pipeline/cancellation.hpp"

namespace shopstack::pipeline::shell {

using Environment = std::map<std::string, std::string>;

struct CommandResult {
  int         exit_code = 0;
  std::string output;
};

/*
  Runs one command line through /bin/sh.

  The child inherits the process environment overlaid with `env`, runs in
  its own process group and has stdout and stderr merged. The token is
  polled while output is drained; once raised the group gets SIGTERM and
  OperationCancelled is thrown after the child is reaped.
*/
CommandResult Run(const std::string& command, const Environment& env, const CancellationToken& token);

// Runs commands in order; throws std::runtime_error on the first non-zero exit.
std::string RunAll(const std::vector<std::string>& commands, const Environment& env, const CancellationToken& token);

} // namespace shopstack::pipeline::shell
