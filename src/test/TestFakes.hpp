#pragma once

#include "CatalogStore.hpp"
#include "MetadataProbe.hpp"
#include "PathNormalizer.hpp"
#include "ThumbnailGenerator.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipsync::test {

// Failure counter shared by the checks of one test executable.
inline int &failures() {
  static int count = 0;
  return count;
}

inline void check(bool condition, const std::string &what) {
  if (condition) {
    std::cout << "[PASS] " << what << std::endl;
  } else {
    std::cout << "[FAIL] " << what << std::endl;
    failures()++;
  }
}

inline int finish(const std::string &suite) {
  if (failures() == 0) {
    std::cout << "[Test] " << suite << " completed." << std::endl;
    return 0;
  }
  std::cout << "[Test] " << suite << ": " << failures() << " failure(s)."
            << std::endl;
  return 1;
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    std::random_device rd;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    m_path = std::filesystem::temp_directory_path() /
             (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(m_path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  std::string path() const { return m_path.generic_string(); }

  // Creates parent directories as needed; returns the absolute path.
  std::string touch(const std::string &relative,
                    const std::string &content = "data") const {
    auto full = m_path / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream(full, std::ios::binary) << content;
    return full.generic_string();
  }

  std::string mkdir(const std::string &relative) const {
    auto full = m_path / relative;
    std::filesystem::create_directories(full);
    return full.generic_string();
  }

private:
  std::filesystem::path m_path;
};

/**
 * In-memory catalog enforcing the same unique location key as the SQLite
 * store. Unavailability can be switched on for any call.
 */
class FakeCatalog : public CatalogStore {
public:
  explicit FakeCatalog(bool caseInsensitive = true)
      : m_normalizer(caseInsensitive) {}

  bool unavailable = false;        // every call reports Unavailable
  int failCreatesAfter = -1;       // Unavailable once this many creates ran
  std::atomic<int> createCalls{0};

  int64_t seed(const std::string &location, const std::string &title = "",
               StorageType type = StorageType::Local) {
    std::lock_guard<std::mutex> lock(m_mtx);
    CatalogEntry entry;
    entry.id = m_nextId++;
    entry.storageType = type;
    entry.locationKey = location;
    entry.title = title.empty() ? "clip" + std::to_string(entry.id) : title;
    m_entries[entry.id] = entry;
    return entry.id;
  }

  // Removes an entry behind the engine's back.
  void eraseDirect(int64_t id) {
    std::lock_guard<std::mutex> lock(m_mtx);
    m_entries.erase(id);
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_entries.size();
  }

  std::optional<CatalogEntry> find(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_entries.find(id);
    if (it == m_entries.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<std::vector<CatalogEntry>> listLocalEntries() override {
    std::lock_guard<std::mutex> lock(m_mtx);
    if (unavailable)
      return std::nullopt;
    std::vector<CatalogEntry> result;
    for (const auto &[id, entry] : m_entries) {
      if (entry.storageType == StorageType::Local)
        result.push_back(entry);
    }
    return result;
  }

  CreateResult createEntry(const std::string &locationKey,
                           const std::string &title,
                           int32_t durationSeconds) override {
    std::lock_guard<std::mutex> lock(m_mtx);
    CreateResult result;
    int calls = createCalls++;
    if (unavailable || (failCreatesAfter >= 0 && calls >= failCreatesAfter)) {
      result.status = CatalogStatus::Unavailable;
      result.message = "database is locked";
      return result;
    }
    std::string key = m_normalizer.normalize(locationKey);
    for (const auto &[id, entry] : m_entries) {
      if (entry.storageType == StorageType::Local &&
          keyOrRaw(entry.locationKey) == key) {
        result.status = CatalogStatus::Duplicate;
        result.message = "A clip with this file path already exists";
        return result;
      }
    }
    CatalogEntry entry;
    entry.id = m_nextId++;
    entry.locationKey = locationKey;
    entry.title = title;
    entry.durationSeconds = durationSeconds;
    m_entries[entry.id] = entry;
    result.status = CatalogStatus::Ok;
    result.id = entry.id;
    return result;
  }

  DeleteResult deleteEntry(int64_t id) override {
    std::lock_guard<std::mutex> lock(m_mtx);
    DeleteResult result;
    if (unavailable) {
      result.status = CatalogStatus::Unavailable;
      result.message = "database is locked";
      return result;
    }
    auto it = m_entries.find(id);
    if (it == m_entries.end() ||
        it->second.storageType != StorageType::Local) {
      result.status = CatalogStatus::NotFound;
      result.message = "Clip with ID " + std::to_string(id) + " not found";
      return result;
    }
    result.status = CatalogStatus::Ok;
    result.removed = it->second;
    m_entries.erase(it);
    return result;
  }

  bool updateThumbnail(int64_t id, const std::string &thumbnailPath) override {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_entries.find(id);
    if (unavailable || it == m_entries.end())
      return false;
    it->second.thumbnailPath = thumbnailPath;
    return true;
  }

  std::optional<std::string> getSetting(const std::string &key) override {
    std::lock_guard<std::mutex> lock(m_mtx);
    auto it = m_settings.find(key);
    if (unavailable || it == m_settings.end())
      return std::nullopt;
    return it->second;
  }

  bool putSetting(const std::string &key, const std::string &value) override {
    std::lock_guard<std::mutex> lock(m_mtx);
    if (unavailable)
      return false;
    m_settings[key] = value;
    return true;
  }

private:
  std::string keyOrRaw(const std::string &location) const {
    try {
      return m_normalizer.normalize(location);
    } catch (const std::invalid_argument &) {
      return location;
    }
  }

  PathNormalizer m_normalizer;
  mutable std::mutex m_mtx;
  std::map<int64_t, CatalogEntry> m_entries;
  std::map<std::string, std::string> m_settings;
  int64_t m_nextId = 1;
};

class FakeProbe : public MetadataProbe {
public:
  bool fail = false;
  int32_t duration = 42;
  std::string title; // empty: let the file name stand

  ProbeResult probe(const std::string &) override {
    ProbeResult result;
    if (fail) {
      result.message = "ffprobe exited with status 1";
      return result;
    }
    result.succeeded = true;
    result.durationSeconds = duration;
    result.title = title;
    return result;
  }
};

class FakeThumbnails : public ThumbnailGenerator {
public:
  bool failGenerate = false;
  bool failRemove = false;
  std::vector<int64_t> generated;
  std::vector<int64_t> removed;

  ThumbnailResult generate(int64_t clipId, const std::string &,
                           int32_t) override {
    ThumbnailResult result;
    if (failGenerate) {
      result.message = "ffmpeg not found";
      return result;
    }
    generated.push_back(clipId);
    result.succeeded = true;
    result.thumbnailPath = "thumbnails/" + std::to_string(clipId) + ".jpg";
    return result;
  }

  StepResult remove(int64_t clipId, const std::string &) override {
    StepResult result;
    if (failRemove) {
      result.message = "Failed to delete thumbnail: Permission denied";
      return result;
    }
    removed.push_back(clipId);
    result.succeeded = true;
    return result;
  }
};

} // namespace clipsync::test
