#pragma once

#include <functional>
#include <string>
#include <vector>

namespace nassync {

struct CommandResult {
  int exitCode = -1;
  std::string stdoutText;
  std::string stderrText;
};

/**
 * Runs argv[0] (looked up on PATH) and blocks until it exits.
 * Throws std::system_error when the process cannot be launched at all.
 */
CommandResult runCommand(const std::vector<std::string> &argv);

// Injection point for code that shells out to ping/ssh/rsync.
using CommandRunner =
    std::function<CommandResult(const std::vector<std::string> &argv)>;

std::string joinCommandLine(const std::vector<std::string> &argv);

} // namespace nassync
