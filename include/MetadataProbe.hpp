#pragma once

#include <cstdint>
#include <string>

namespace clipsync {

struct ProbeResult {
  bool succeeded = false;
  std::string title; // empty when the container has no title tag
  int32_t durationSeconds = 0;
  std::string message;
};

/**
 * Resolves duration and embedded title for a newly discovered file. A failed
 * probe never blocks an add; callers fall back to defaults.
 */
class MetadataProbe {
public:
  virtual ~MetadataProbe() = default;
  virtual ProbeResult probe(const std::string &path) = 0;
};

class FfprobeMetadataProbe : public MetadataProbe {
public:
  explicit FfprobeMetadataProbe(std::string binaryFolder = "");

  ProbeResult probe(const std::string &path) override;

  // Parses `ffprobe -print_format json -show_format` output.
  static ProbeResult parseOutput(const std::string &json);

private:
  std::string m_binaryFolder;
};

} // namespace clipsync
