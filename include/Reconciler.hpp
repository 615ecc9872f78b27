#pragma once
#include "PathNormalizer.hpp"
#include "types.hpp"
#include <map>
#include <string>
#include <vector>

namespace clipsync {

/**
 * Reconciler classifies every canonical path seen on disk or in the catalog
 * as New, Missing, Matched or Error. It performs no I/O and never touches the
 * catalog, so the same inputs always give the same diff.
 */
class Reconciler {
public:
  explicit Reconciler(PathNormalizer normalizer = PathNormalizer());

  ReconciliationDiff diff(const std::vector<ScannedFile> &scannedFiles,
                          const std::vector<CatalogEntry> &catalogEntries) const;

private:
  PathNormalizer m_normalizer;

  static ClipSummary summarize(const CatalogEntry &entry);

  void indexScanned(const std::vector<ScannedFile> &scannedFiles,
                    std::map<std::string, const ScannedFile *> &byKey,
                    std::vector<ReconciliationItem> &errors) const;
  void indexCatalog(const std::vector<CatalogEntry> &catalogEntries,
                    std::map<std::string, const CatalogEntry *> &byKey,
                    std::vector<ReconciliationItem> &errors) const;
};

} // namespace clipsync
