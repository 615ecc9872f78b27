#pragma once

#include <string>

namespace clipsync {

struct CommandResult {
  int exitCode = -1;
  std::string output; // stdout, plus stderr when the command redirects it
};

/**
 * Thin popen() wrapper used to drive ffmpeg/ffprobe.
 */
class ProcessUtils {
public:
  static CommandResult run(const std::string &command);

  // Single-quotes an argument for /bin/sh.
  static std::string shellQuote(const std::string &arg);

  // Joins a configured binary folder with a tool name; empty folder means PATH.
  static std::string toolPath(const std::string &binaryFolder,
                              const std::string &tool);
};

} // namespace clipsync
