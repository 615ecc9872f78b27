#include "Reconciler.hpp"
#include "Errors.hpp"

namespace clipsync {

Reconciler::Reconciler(PathNormalizer normalizer) : m_normalizer(normalizer) {}

ClipSummary Reconciler::summarize(const CatalogEntry &entry) {
  ClipSummary clip;
  clip.catalogId = entry.id;
  clip.title = entry.title;
  clip.description = entry.description;
  clip.tags = entry.tags;
  return clip;
}

void Reconciler::indexScanned(
    const std::vector<ScannedFile> &scannedFiles,
    std::map<std::string, const ScannedFile *> &byKey,
    std::vector<ReconciliationItem> &errors) const {
  for (const auto &file : scannedFiles) {
    std::string key;
    try {
      key = m_normalizer.normalize(file.path);
    } catch (const InvalidPathError &e) {
      errors.push_back(
          {file.path, ErrorEntry{std::string("Unusable file path: ") + e.what()}});
      continue;
    }

    auto [it, inserted] = byKey.emplace(key, &file);
    if (!inserted) {
      errors.push_back({file.path, ErrorEntry{"Duplicate file: " + file.path +
                                              " has the same key as " +
                                              it->second->path}});
    }
  }
}

void Reconciler::indexCatalog(
    const std::vector<CatalogEntry> &catalogEntries,
    std::map<std::string, const CatalogEntry *> &byKey,
    std::vector<ReconciliationItem> &errors) const {
  for (const auto &entry : catalogEntries) {
    if (entry.storageType != StorageType::Local)
      continue;

    std::string key;
    try {
      key = m_normalizer.normalize(entry.locationKey);
    } catch (const InvalidPathError &e) {
      errors.push_back({entry.locationKey,
                        ErrorEntry{"Clip " + std::to_string(entry.id) +
                                   " has a malformed location: " + e.what()}});
      continue;
    }

    auto [it, inserted] = byKey.emplace(key, &entry);
    if (!inserted) {
      errors.push_back(
          {m_normalizer.normalizePath(entry.locationKey),
           ErrorEntry{"Duplicate catalog entry: clip " +
                      std::to_string(entry.id) +
                      " has the same location as clip " +
                      std::to_string(it->second->id)}});
    }
  }
}

ReconciliationDiff
Reconciler::diff(const std::vector<ScannedFile> &scannedFiles,
                 const std::vector<CatalogEntry> &catalogEntries) const {
  ReconciliationDiff result;
  result.totalScanned = static_cast<int>(scannedFiles.size());

  std::vector<ReconciliationItem> errors;
  std::map<std::string, const ScannedFile *> scannedByKey;
  std::map<std::string, const CatalogEntry *> catalogByKey;
  indexScanned(scannedFiles, scannedByKey, errors);
  indexCatalog(catalogEntries, catalogByKey, errors);

  // Disk side: New or Matched
  for (const auto &[key, file] : scannedByKey) {
    auto itCatalog = catalogByKey.find(key);
    if (itCatalog == catalogByKey.end()) {
      result.items.push_back(
          {file->path, NewFile{file->directory, file->sizeBytes,
                               file->modifiedAt}});
      result.newFilesCount++;
    } else {
      result.items.push_back(
          {file->path,
           MatchedFile{file->directory, file->sizeBytes, file->modifiedAt,
                       summarize(*itCatalog->second)}});
      result.matchedFilesCount++;
    }
  }

  // Catalog side: Missing
  for (const auto &[key, entry] : catalogByKey) {
    if (scannedByKey.find(key) != scannedByKey.end())
      continue;
    result.items.push_back({m_normalizer.normalizePath(entry->locationKey),
                            MissingClip{summarize(*entry)}});
    result.missingFilesCount++;
  }

  result.errorCount = static_cast<int>(errors.size());
  for (auto &error : errors)
    result.items.push_back(std::move(error));

  return result;
}

} // namespace clipsync
