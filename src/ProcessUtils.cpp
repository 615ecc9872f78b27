#include "ProcessUtils.hpp"
#include <array>
#include <cstdio>
#include <filesystem>
#include <sys/wait.h>

namespace clipsync {

CommandResult ProcessUtils::run(const std::string &command) {
  CommandResult result;
  FILE *pipe = popen(command.c_str(), "r");
  if (!pipe) {
    result.output = "Unable to start process";
    return result;
  }

  std::array<char, 4096> buffer{};
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    result.output += buffer.data();
  }

  int status = pclose(pipe);
  if (status == -1)
    result.exitCode = -1;
  else if (WIFEXITED(status))
    result.exitCode = WEXITSTATUS(status);
  else
    result.exitCode = 128 + WTERMSIG(status);
  return result;
}

std::string ProcessUtils::shellQuote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string ProcessUtils::toolPath(const std::string &binaryFolder,
                                   const std::string &tool) {
  if (binaryFolder.empty())
    return tool;
  return (std::filesystem::path(binaryFolder) / tool).string();
}

} // namespace clipsync
