#include "SyncExecutor.hpp"
#include "Errors.hpp"
#include "FileSystemScanner.hpp"
#include "LogUtils.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace clipsync {

SyncExecutor::SyncExecutor(CatalogStore &catalog, MetadataProbe &probe,
                           ThumbnailGenerator &thumbnails,
                           PathNormalizer normalizer)
    : m_catalog(catalog), m_probe(probe), m_thumbnails(thumbnails),
      m_normalizer(normalizer) {}

void SyncExecutor::record(SyncReport &report, SyncOutcome outcome) {
  report.processed++;
  switch (outcome.outcome) {
  case SyncOutcomeKind::Added:
    report.totalAdded++;
    report.addedClips.push_back(std::move(outcome));
    break;
  case SyncOutcomeKind::Removed:
    report.totalRemoved++;
    report.removedClips.push_back(std::move(outcome));
    break;
  case SyncOutcomeKind::Failed:
    report.errors.push_back(std::move(outcome));
    break;
  }
}

SyncReport
SyncExecutor::apply(const SyncSelection &selection,
                    const std::string &rootFolder,
                    const CancellationFlag *cancel,
                    const std::map<int64_t, std::string> *presentClips) {
  SyncReport report;
  report.rootFolderPath = rootFolder;
  const std::string rootKey = m_normalizer.normalize(rootFolder);

  std::cout << "[Executor] Applying " << selection.filesToAdd.size()
            << " additions and " << selection.clipIdsToRemove.size()
            << " removals" << std::endl;

  for (const auto &path : selection.filesToAdd) {
    if (cancel && cancel->isCancelled()) {
      report.cancelled = true;
      break;
    }
    record(report, addFile(path, rootKey));
  }

  for (int64_t clipId : selection.clipIdsToRemove) {
    if (report.cancelled || (cancel && cancel->isCancelled())) {
      report.cancelled = true;
      break;
    }
    if (presentClips) {
      auto present = presentClips->find(clipId);
      if (present != presentClips->end()) {
        SyncOutcome refused;
        refused.filePath = present->second;
        refused.clipId = clipId;
        refused.outcome = SyncOutcomeKind::Failed;
        refused.errorMessage = "File still exists: " + present->second;
        std::cout << "[Executor] Keeping clip " << clipId << ", file exists: "
                  << LogUtils::sanitizePath(present->second) << std::endl;
        record(report, std::move(refused));
        continue;
      }
    }
    record(report, removeClip(clipId));
  }

  if (report.cancelled) {
    std::cout << "[Executor] Cancelled after " << report.processed
              << " items" << std::endl;
  }
  std::cout << "[Executor] Added " << report.totalAdded << ", removed "
            << report.totalRemoved << ", failed " << report.errors.size()
            << std::endl;
  return report;
}

SyncOutcome SyncExecutor::addFile(const std::string &rawPath,
                                  const std::string &rootKey) {
  SyncOutcome outcome;
  outcome.filePath = rawPath;
  outcome.outcome = SyncOutcomeKind::Failed;

  std::string path;
  try {
    path = m_normalizer.normalizePath(rawPath);
  } catch (const InvalidPathError &e) {
    outcome.errorMessage = e.what();
    return outcome;
  }
  outcome.filePath = path;
  outcome.title = fs::path(path).stem().string();

  if (!PathNormalizer::isWithin(m_normalizer.keyFor(path), rootKey)) {
    outcome.errorMessage = "File is outside the root folder";
    return outcome;
  }
  if (!FileSystemScanner::isVideoFile(path)) {
    outcome.errorMessage = "Unsupported video extension";
    return outcome;
  }
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    outcome.errorMessage = "File does not exist";
    return outcome;
  }

  // Metadata: degrade to the file name and zero duration
  int32_t duration = 0;
  ProbeResult probe = m_probe.probe(path);
  if (probe.succeeded) {
    duration = probe.durationSeconds;
    if (!probe.title.empty())
      outcome.title = probe.title;
  } else {
    outcome.warnings.push_back("Metadata probe failed: " + probe.message);
  }

  CreateResult created = m_catalog.createEntry(path, outcome.title, duration);
  switch (created.status) {
  case CatalogStatus::Ok:
    break;
  case CatalogStatus::Unavailable:
    throw CatalogUnavailableError("Catalog unavailable while adding " + path +
                                  ": " + created.message);
  case CatalogStatus::Duplicate:
    outcome.errorMessage = created.message.empty()
                               ? "A clip with this file path already exists"
                               : created.message;
    std::cout << "[Executor] Skipping duplicate: "
              << LogUtils::sanitizePath(path) << std::endl;
    return outcome;
  default:
    outcome.errorMessage = "Error adding clip: " + created.message;
    std::cerr << "[Executor] Error adding clip: "
              << LogUtils::sanitizePath(path) << " - " << created.message
              << std::endl;
    return outcome;
  }
  outcome.clipId = created.id;

  ThumbnailResult thumbnail = m_thumbnails.generate(created.id, path, duration);
  if (!thumbnail.succeeded) {
    outcome.warnings.push_back("Thumbnail generation failed: " +
                               thumbnail.message);
  } else if (!m_catalog.updateThumbnail(created.id, thumbnail.thumbnailPath)) {
    outcome.warnings.push_back("Thumbnail generated but not recorded");
  }

  outcome.outcome = SyncOutcomeKind::Added;
  std::cout << "[Executor] Added clip " << created.id << ": "
            << LogUtils::sanitizePath(path) << std::endl;
  return outcome;
}

SyncOutcome SyncExecutor::removeClip(int64_t clipId) {
  SyncOutcome outcome;
  outcome.clipId = clipId;
  outcome.outcome = SyncOutcomeKind::Failed;

  DeleteResult deleted = m_catalog.deleteEntry(clipId);
  switch (deleted.status) {
  case CatalogStatus::Ok:
    break;
  case CatalogStatus::Unavailable:
    throw CatalogUnavailableError("Catalog unavailable while removing clip " +
                                  std::to_string(clipId) + ": " +
                                  deleted.message);
  case CatalogStatus::NotFound:
    outcome.errorMessage =
        deleted.message.empty()
            ? "Clip with ID " + std::to_string(clipId) + " not found"
            : deleted.message;
    return outcome;
  default:
    outcome.errorMessage = "Error removing clip: " + deleted.message;
    std::cerr << "[Executor] Error removing clip " << clipId << ": "
              << deleted.message << std::endl;
    return outcome;
  }

  outcome.filePath = deleted.removed.locationKey;
  outcome.title = deleted.removed.title;

  StepResult thumbnail =
      m_thumbnails.remove(clipId, deleted.removed.thumbnailPath.value_or(""));
  if (!thumbnail.succeeded)
    outcome.warnings.push_back(thumbnail.message);

  outcome.outcome = SyncOutcomeKind::Removed;
  std::cout << "[Executor] Removed clip " << clipId << ": "
            << LogUtils::sanitizePath(outcome.filePath) << std::endl;
  return outcome;
}

} // namespace clipsync
