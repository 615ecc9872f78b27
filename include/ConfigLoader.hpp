/**
 * @file ConfigLoader.hpp
 * @brief Loads clipsync.json into an AppConfig value.
 */

#pragma once

#include <string>

namespace clipsync {

struct AppConfig {
  std::string databasePath = "clipsync.db";
  std::string defaultRootFolder;
  bool caseInsensitivePaths = true;
  std::string thumbnailsDirectory = "thumbnails";
  int thumbnailWidth = 320;
  int thumbnailHeight = 180;
  std::string ffmpegBinaryFolder; // empty: use PATH
  std::string serverHost = "127.0.0.1";
  int serverPort = 5000;
  int watchSettleMs = 2000;
};

class ConfigLoader {
public:
  /**
   * @brief Reads the configuration file.
   * @return Defaults when the file is missing; defaults plus a logged error
   *         when it cannot be parsed. Keys not present keep their defaults.
   */
  static AppConfig load(const std::string &configPath);

  /**
   * @brief Applies the keys of a JSON document onto a config.
   * @throws nlohmann::json::exception on malformed text or mistyped values.
   */
  static AppConfig parse(const std::string &text, AppConfig base = AppConfig());
};

} // namespace clipsync
