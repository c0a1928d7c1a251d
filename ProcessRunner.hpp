#pragma once

#include <string>
#include <vector>

struct CommandResult {
  int exit_code = -1;
  std::string output;
};

namespace ProcessRunner {
// Exit status the shell reports for a command it could not find.
inline constexpr int kCommandNotFound = 127;

// Runs `program args...` through the shell with every argument quoted, and
// captures stdout and stderr together.
CommandResult run(const std::string& program,
                  const std::vector<std::string>& args);

bool has_tool(const std::string& program);

std::string quote(const std::string& arg);
}  // namespace ProcessRunner
