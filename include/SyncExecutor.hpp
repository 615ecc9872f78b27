#pragma once
#include "CancellationFlag.hpp"
#include "CatalogStore.hpp"
#include "MetadataProbe.hpp"
#include "PathNormalizer.hpp"
#include "ThumbnailGenerator.hpp"
#include "types.hpp"
#include <map>
#include <string>

namespace clipsync {

/**
 * SyncExecutor applies a selection of additions and removals to the catalog,
 * one item at a time, in the order given. A failing item becomes a Failed
 * outcome and the batch continues. Only an unreachable catalog stops it
 * (CatalogUnavailableError); whatever was committed before stays committed.
 */
class SyncExecutor {
public:
  SyncExecutor(CatalogStore &catalog, MetadataProbe &probe,
               ThumbnailGenerator &thumbnails,
               PathNormalizer normalizer = PathNormalizer());

  // rootFolder must already be validated and normalized. Clip ids found in
  // presentClips (id -> path of a file that still exists) are refused.
  SyncReport
  apply(const SyncSelection &selection, const std::string &rootFolder,
        const CancellationFlag *cancel = nullptr,
        const std::map<int64_t, std::string> *presentClips = nullptr);

private:
  CatalogStore &m_catalog;
  MetadataProbe &m_probe;
  ThumbnailGenerator &m_thumbnails;
  PathNormalizer m_normalizer;

  SyncOutcome addFile(const std::string &rawPath, const std::string &rootKey);
  SyncOutcome removeClip(int64_t clipId);
  static void record(SyncReport &report, SyncOutcome outcome);
};

} // namespace clipsync
