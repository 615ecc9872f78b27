#include "ThumbnailGenerator.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace clipsync {

FfmpegThumbnailGenerator::FfmpegThumbnailGenerator(std::string thumbnailsDirectory,
                                                   int width, int height,
                                                   std::string binaryFolder)
    : m_directory(std::move(thumbnailsDirectory)), m_width(width),
      m_height(height), m_binaryFolder(std::move(binaryFolder)) {}

std::string FfmpegThumbnailGenerator::getThumbnailPath(int64_t clipId) const {
  return (fs::path(m_directory) / (std::to_string(clipId) + ".jpg"))
      .generic_string();
}

double FfmpegThumbnailGenerator::captureTime(int32_t durationSeconds) {
  if (durationSeconds <= 0)
    return 1.0;
  return durationSeconds * 0.1;
}

ThumbnailResult FfmpegThumbnailGenerator::generate(int64_t clipId,
                                                   const std::string &videoPath,
                                                   int32_t durationSeconds) {
  ThumbnailResult result;
  std::error_code ec;
  if (!fs::is_regular_file(videoPath, ec)) {
    result.message = "Video file not found";
    std::cerr << "[Thumbnail] Video file not found: "
              << LogUtils::sanitizePath(videoPath) << std::endl;
    return result;
  }

  fs::create_directories(m_directory, ec);
  if (ec) {
    result.message = "Cannot create thumbnails directory: " + ec.message();
    std::cerr << "[Thumbnail] " << result.message << std::endl;
    return result;
  }

  std::string outputPath = getThumbnailPath(clipId);
  std::ostringstream filter;
  filter << "scale=" << m_width << ":" << m_height
         << ":force_original_aspect_ratio=decrease";

  std::ostringstream command;
  command << ProcessUtils::shellQuote(
                 ProcessUtils::toolPath(m_binaryFolder, "ffmpeg"))
          << " -v error -y -ss " << captureTime(durationSeconds) << " -i "
          << ProcessUtils::shellQuote(videoPath)
          << " -frames:v 1 -vf " << ProcessUtils::shellQuote(filter.str())
          << " -q:v 3 " << ProcessUtils::shellQuote(outputPath) << " 2>&1";

  CommandResult run = ProcessUtils::run(command.str());
  if (run.exitCode == 127) {
    result.message = m_binaryFolder.empty()
                         ? "ffmpeg not found. Install FFmpeg and add it to "
                           "PATH, or set ffmpeg.binaryFolder"
                         : "ffmpeg not found at configured path '" +
                               m_binaryFolder + "'";
  } else if (run.exitCode != 0) {
    result.message = "ffmpeg exited with status " +
                     std::to_string(run.exitCode) + ": " +
                     LogUtils::sanitize(run.output, 200);
  } else if (!fs::exists(outputPath, ec)) {
    result.message = "ffmpeg produced no image";
  } else {
    result.succeeded = true;
    result.thumbnailPath = outputPath;
    std::cout << "[Thumbnail] Generated thumbnail for clip " << clipId
              << std::endl;
    return result;
  }

  std::cerr << "[Thumbnail] Failed to generate thumbnail for clip " << clipId
            << " from " << LogUtils::sanitizePath(videoPath) << ". "
            << result.message << std::endl;
  return result;
}

StepResult FfmpegThumbnailGenerator::remove(int64_t clipId,
                                            const std::string &thumbnailPath) {
  StepResult result;
  std::string path =
      thumbnailPath.empty() ? getThumbnailPath(clipId) : thumbnailPath;

  std::error_code ec;
  fs::remove(path, ec); // false without error when the file was never made
  if (ec) {
    result.message = "Failed to delete thumbnail: " + ec.message();
    std::cerr << "[Thumbnail] " << result.message << " ("
              << LogUtils::sanitizePath(path) << ")" << std::endl;
    return result;
  }
  result.succeeded = true;
  return result;
}

} // namespace clipsync
