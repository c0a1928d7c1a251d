#include "ProcessRunner.hpp"

#include <sys/wait.h>

#include <cstdio>
#include <cstdlib>
#include <format>

#include "Errors.hpp"
#include "IOManager.hpp"

std::string ProcessRunner::quote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

CommandResult ProcessRunner::run(const std::string& program,
                                 const std::vector<std::string>& args) {
  std::string cmd = quote(program);
  for (const auto& arg : args) {
    cmd += ' ';
    cmd += quote(arg);
  }
  cmd += " 2>&1";

  IOManager::log(std::format("Running: {}", cmd));

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw ToolError(std::format("popen failed to start '{}'", program));
  }

  CommandResult result;
  char buffer[256];
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result.output.append(buffer);
  }
  const int status = pclose(pipe);
  if (status == -1) {
    throw ToolError(std::format("Lost track of '{}' while waiting", program));
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  return result;
}

bool ProcessRunner::has_tool(const std::string& program) {
  const std::string cmd = "command -v " + quote(program) + " >/dev/null 2>&1";
  return std::system(cmd.c_str()) == 0;
}
