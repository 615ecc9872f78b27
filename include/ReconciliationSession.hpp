#pragma once
#include "CancellationFlag.hpp"
#include "CatalogStore.hpp"
#include "FileSystemScanner.hpp"
#include "MetadataProbe.hpp"
#include "Reconciler.hpp"
#include "SyncExecutor.hpp"
#include "ThumbnailGenerator.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

enum class SessionState {
  Idle,
  Scanning,
  Diffing,
  Ready,
  Applying,
  Completed,
  Failed
};

const char *sessionStateName(SessionState state);

struct SessionOptions {
  std::string defaultRootFolder; // used when a call passes an empty root
  bool caseInsensitivePaths = true;
  // Process-wide shutdown. Never cleared by the session.
  std::shared_ptr<const CancellationFlag> shutdown;
};

/**
 * ReconciliationSession drives one caller's scan → diff → apply cycle.
 *
 * preview() stops in Ready with the diff held in memory; calling it again
 * discards the previous diff. apply() executes a caller-chosen selection and
 * fullSync() selects every New and Missing item itself. Both end in Completed
 * even when items fail. RootNotFoundError and CatalogUnavailableError leave
 * the session in Failed and propagate to the caller.
 *
 * cancel() stops the run in progress (or the next one, if called between
 * runs). The request is consumed when that run ends.
 */
class ReconciliationSession {
public:
  ReconciliationSession(CatalogStore &catalog, MetadataProbe &probe,
                        ThumbnailGenerator &thumbnails,
                        SessionOptions options = SessionOptions());

  PreviewReport preview(const std::string &rootFolderPath);
  SyncReport apply(const std::string &rootFolderPath,
                   const SyncSelection &selection);
  SyncReport fullSync(const std::string &rootFolderPath);

  void cancel();
  SessionState state() const { return m_state; }
  const std::optional<ReconciliationDiff> &currentDiff() const {
    return m_diff;
  }

  static SyncSelection selectAll(const ReconciliationDiff &diff);

private:
  struct ScanOutcome {
    std::string root;
    std::vector<ScannedFile> files;
    std::vector<std::string> warnings;
    bool cancelled = false;
  };

  CatalogStore &m_catalog;
  SessionOptions m_options;
  PathNormalizer m_normalizer;
  FileSystemScanner m_scanner;
  Reconciler m_reconciler;
  SyncExecutor m_executor;
  CancellationFlag m_cancel; // cleared when a run completes or fails
  SessionState m_state = SessionState::Idle;
  std::optional<ReconciliationDiff> m_diff;

  void transition(SessionState next);
  std::string resolveRoot(const std::string &rootFolderPath) const;
  ScanOutcome runScan(const std::string &rootFolderPath);
  ReconciliationDiff runDiff(const std::vector<ScannedFile> &files);
  SyncReport runApply(const ScanOutcome &scan, const SyncSelection &selection);
  SyncReport cancelledReport(const ScanOutcome &scan);
};

} // namespace clipsync
