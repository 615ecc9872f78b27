/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "ConfigLoader.hpp"
#include "LogUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace clipsync {

namespace {

template <typename T>
void readKey(const nlohmann::json &section, const char *key, T &target) {
  if (section.is_object() && section.contains(key) && !section[key].is_null())
    target = section[key].get<T>();
}

const nlohmann::json &sectionOf(const nlohmann::json &root, const char *key) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (root.contains(key) && root[key].is_object())
    return root[key];
  return empty;
}

} // namespace

AppConfig ConfigLoader::parse(const std::string &text, AppConfig base) {
  AppConfig config = base;
  auto j = nlohmann::json::parse(text);
  if (!j.is_object())
    return config;

  readKey(j, "database", config.databasePath);
  readKey(sectionOf(j, "videoLibrary"), "rootFolder", config.defaultRootFolder);
  readKey(sectionOf(j, "paths"), "caseInsensitive", config.caseInsensitivePaths);

  const auto &thumbnails = sectionOf(j, "thumbnails");
  readKey(thumbnails, "directory", config.thumbnailsDirectory);
  readKey(thumbnails, "width", config.thumbnailWidth);
  readKey(thumbnails, "height", config.thumbnailHeight);

  readKey(sectionOf(j, "ffmpeg"), "binaryFolder", config.ffmpegBinaryFolder);

  const auto &server = sectionOf(j, "server");
  readKey(server, "host", config.serverHost);
  readKey(server, "port", config.serverPort);

  readKey(sectionOf(j, "watch"), "settleMs", config.watchSettleMs);
  return config;
}

AppConfig ConfigLoader::load(const std::string &configPath) {
  AppConfig config;
  std::error_code ec;
  if (!std::filesystem::exists(configPath, ec)) {
    std::cout << "[Config] " << LogUtils::sanitizePath(configPath)
              << " not found, using defaults" << std::endl;
    return config;
  }

  try {
    std::ifstream f(configPath);
    std::stringstream buffer;
    buffer << f.rdbuf();
    config = parse(buffer.str());
    std::cout << "[Config] Loaded " << LogUtils::sanitizePath(configPath)
              << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "[Config] Error reading " << LogUtils::sanitizePath(configPath)
              << ": " << e.what() << std::endl;
  }
  return config;
}

} // namespace clipsync
