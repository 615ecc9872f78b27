#include "MetadataProbe.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace clipsync {

FfprobeMetadataProbe::FfprobeMetadataProbe(std::string binaryFolder)
    : m_binaryFolder(std::move(binaryFolder)) {}

ProbeResult FfprobeMetadataProbe::parseOutput(const std::string &output) {
  ProbeResult result;
  try {
    auto data = json::parse(output);
    if (!data.contains("format") || !data["format"].is_object()) {
      result.message = "ffprobe output has no format section";
      return result;
    }
    const auto &format = data["format"];

    // ffprobe reports duration as a decimal string
    if (format.contains("duration")) {
      double seconds = 0.0;
      if (format["duration"].is_string())
        seconds = std::stod(format["duration"].get<std::string>());
      else if (format["duration"].is_number())
        seconds = format["duration"].get<double>();
      if (!std::isfinite(seconds)) {
        result.message = "ffprobe reported an invalid duration";
        return result;
      }
      if (seconds <= 0.0)
        result.durationSeconds = 0;
      else if (seconds >= std::numeric_limits<int32_t>::max())
        result.durationSeconds = std::numeric_limits<int32_t>::max();
      else
        result.durationSeconds = static_cast<int32_t>(std::lround(seconds));
    }

    if (format.contains("tags") && format["tags"].is_object()) {
      const auto &tags = format["tags"];
      for (const char *key : {"title", "TITLE"}) {
        if (tags.contains(key) && tags[key].is_string()) {
          result.title = tags[key].get<std::string>();
          break;
        }
      }
    }
    result.succeeded = true;
  } catch (const std::exception &e) {
    result.message = std::string("Unreadable ffprobe output: ") + e.what();
  }
  return result;
}

ProbeResult FfprobeMetadataProbe::probe(const std::string &path) {
  std::string command =
      ProcessUtils::shellQuote(ProcessUtils::toolPath(m_binaryFolder, "ffprobe")) +
      " -v error -print_format json -show_format " +
      ProcessUtils::shellQuote(path) + " 2>/dev/null";

  CommandResult run = ProcessUtils::run(command);
  if (run.exitCode == 127) {
    ProbeResult result;
    result.message = "ffprobe not found. Install FFmpeg or set "
                     "ffmpeg.binaryFolder in the configuration";
    std::cerr << "[Probe] " << result.message << std::endl;
    return result;
  }
  if (run.exitCode != 0) {
    ProbeResult result;
    result.message = "ffprobe exited with status " + std::to_string(run.exitCode);
    std::cerr << "[Probe] " << result.message << " for "
              << LogUtils::sanitizePath(path) << std::endl;
    return result;
  }

  ProbeResult result = parseOutput(run.output);
  if (!result.succeeded) {
    std::cerr << "[Probe] " << result.message << " for "
              << LogUtils::sanitizePath(path) << std::endl;
  }
  return result;
}

} // namespace clipsync
