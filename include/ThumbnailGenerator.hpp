#pragma once

#include <cstdint>
#include <string>

namespace clipsync {

struct ThumbnailResult {
  bool succeeded = false;
  std::string thumbnailPath;
  std::string message;
};

struct StepResult {
  bool succeeded = false;
  std::string message;
};

/**
 * Produces and deletes clip thumbnails. Both operations are best-effort:
 * failures are returned, never thrown, and never fail the surrounding add or
 * remove.
 */
class ThumbnailGenerator {
public:
  virtual ~ThumbnailGenerator() = default;

  // durationSeconds is a hint for picking the frame; 0 means unknown.
  virtual ThumbnailResult generate(int64_t clipId, const std::string &videoPath,
                                   int32_t durationSeconds) = 0;

  // Deletes the stored image. thumbnailPath may be empty, in which case the
  // generator's default location for clipId is used.
  virtual StepResult remove(int64_t clipId, const std::string &thumbnailPath) = 0;
};

class FfmpegThumbnailGenerator : public ThumbnailGenerator {
public:
  FfmpegThumbnailGenerator(std::string thumbnailsDirectory, int width,
                           int height, std::string binaryFolder = "");

  ThumbnailResult generate(int64_t clipId, const std::string &videoPath,
                           int32_t durationSeconds) override;
  StepResult remove(int64_t clipId, const std::string &thumbnailPath) override;

  std::string getThumbnailPath(int64_t clipId) const;

  // Frame offset in seconds: 10% into the clip, 1s when the duration is
  // unknown.
  static double captureTime(int32_t durationSeconds);

private:
  std::string m_directory;
  int m_width;
  int m_height;
  std::string m_binaryFolder;
};

} // namespace clipsync
