#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace clipsync {

enum class StorageType { Local = 0, YouTube = 1 };

struct Tag {
  int64_t id = 0;
  std::string category;
  std::string value;
};

// Read-only projection of a clip owned by the catalog store.
struct CatalogEntry {
  int64_t id = 0;
  StorageType storageType = StorageType::Local;
  std::string locationKey; // file path for Local, video URL otherwise
  std::string title;
  std::string description;
  int32_t durationSeconds = 0;
  std::optional<std::string> thumbnailPath;
  std::vector<Tag> tags;
};

struct ScannedFile {
  std::string path; // Normalized absolute path, original case
  std::string key;  // Comparison key
  std::string directory;
  std::string filename;
  uint64_t sizeBytes = 0;
  int64_t modifiedAt = 0; // UTC timestamp
};

enum class ReconciliationStatus { New = 0, Missing = 1, Matched = 2, Error = 3 };

struct ClipSummary {
  int64_t catalogId = 0;
  std::string title;
  std::string description;
  std::vector<Tag> tags;
};

struct NewFile {
  std::string directory;
  uint64_t fileSizeBytes = 0;
  int64_t modifiedAt = 0;
};

struct MissingClip {
  ClipSummary clip;
};

struct MatchedFile {
  std::string directory;
  uint64_t fileSizeBytes = 0;
  int64_t modifiedAt = 0;
  ClipSummary clip;
};

struct ErrorEntry {
  std::string errorMessage;
};

// Alternative order follows ReconciliationStatus.
using ReconciliationDetail =
    std::variant<NewFile, MissingClip, MatchedFile, ErrorEntry>;

struct ReconciliationItem {
  std::string filePath;
  ReconciliationDetail detail;

  ReconciliationStatus status() const {
    return static_cast<ReconciliationStatus>(detail.index());
  }

  std::optional<int64_t> catalogId() const {
    if (auto *m = std::get_if<MatchedFile>(&detail))
      return m->clip.catalogId;
    if (auto *m = std::get_if<MissingClip>(&detail))
      return m->clip.catalogId;
    return std::nullopt;
  }
};

struct ReconciliationDiff {
  std::vector<ReconciliationItem> items;
  int totalScanned = 0;
  int newFilesCount = 0;
  int missingFilesCount = 0;
  int matchedFilesCount = 0;
  int errorCount = 0;
};

struct PreviewReport {
  std::string rootFolderPath;
  ReconciliationDiff diff;
  std::vector<std::string> scanWarnings;
  bool cancelled = false;
};

struct SyncSelection {
  std::vector<std::string> filesToAdd;
  std::vector<int64_t> clipIdsToRemove;
};

enum class SyncOutcomeKind { Added, Removed, Failed };

struct SyncOutcome {
  std::string filePath;
  std::optional<int64_t> clipId;
  std::string title;
  SyncOutcomeKind outcome = SyncOutcomeKind::Failed;
  std::string errorMessage;
  std::vector<std::string> warnings; // best-effort steps that did not succeed
};

struct SyncReport {
  std::string rootFolderPath;
  std::vector<SyncOutcome> addedClips;
  std::vector<SyncOutcome> removedClips;
  std::vector<SyncOutcome> errors;
  std::vector<std::string> scanWarnings;
  int totalScanned = 0;
  int totalAdded = 0;
  int totalRemoved = 0;
  int processed = 0;
  bool cancelled = false;
};

} // namespace clipsync
