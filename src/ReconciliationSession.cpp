#include "ReconciliationSession.hpp"
#include "Errors.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

namespace clipsync {

const char *sessionStateName(SessionState state) {
  switch (state) {
  case SessionState::Idle:
    return "Idle";
  case SessionState::Scanning:
    return "Scanning";
  case SessionState::Diffing:
    return "Diffing";
  case SessionState::Ready:
    return "Ready";
  case SessionState::Applying:
    return "Applying";
  case SessionState::Completed:
    return "Completed";
  case SessionState::Failed:
    return "Failed";
  }
  return "Unknown";
}

namespace {
// Consumes a per-run cancel request on every exit path of a run.
struct RunScope {
  CancellationFlag &flag;
  ~RunScope() { flag.reset(); }
};
} // namespace

ReconciliationSession::ReconciliationSession(CatalogStore &catalog,
                                             MetadataProbe &probe,
                                             ThumbnailGenerator &thumbnails,
                                             SessionOptions options)
    : m_catalog(catalog), m_options(std::move(options)),
      m_normalizer(m_options.caseInsensitivePaths), m_scanner(m_normalizer),
      m_reconciler(m_normalizer),
      m_executor(catalog, probe, thumbnails, m_normalizer),
      m_cancel(m_options.shutdown) {}

void ReconciliationSession::transition(SessionState next) {
  if (next == m_state)
    return;
  std::cout << "[Session] " << sessionStateName(m_state) << " -> "
            << sessionStateName(next) << std::endl;
  m_state = next;
}

void ReconciliationSession::cancel() { m_cancel.cancel(); }

std::string
ReconciliationSession::resolveRoot(const std::string &rootFolderPath) const {
  bool blank =
      std::all_of(rootFolderPath.begin(), rootFolderPath.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c));
      });
  return blank ? m_options.defaultRootFolder : rootFolderPath;
}

ReconciliationSession::ScanOutcome
ReconciliationSession::runScan(const std::string &rootFolderPath) {
  transition(SessionState::Scanning);
  ScanOutcome outcome;
  try {
    ScanCursor cursor = m_scanner.scan(resolveRoot(rootFolderPath), &m_cancel);
    outcome.root = cursor.root();
    while (auto file = cursor.next())
      outcome.files.push_back(std::move(*file));
    outcome.warnings = cursor.warnings();
    outcome.cancelled = cursor.cancelled();
  } catch (const RootNotFoundError &e) {
    std::cerr << "[Session] " << e.what() << ": "
              << LogUtils::sanitizePath(rootFolderPath) << std::endl;
    transition(SessionState::Failed);
    throw;
  }
  return outcome;
}

ReconciliationDiff
ReconciliationSession::runDiff(const std::vector<ScannedFile> &files) {
  transition(SessionState::Diffing);
  auto entries = m_catalog.listLocalEntries();
  if (!entries) {
    transition(SessionState::Failed);
    throw CatalogUnavailableError("Catalog store is unreachable");
  }
  ReconciliationDiff diff = m_reconciler.diff(files, *entries);
  std::cout << "[Reconcile] " << diff.totalScanned << " scanned, "
            << diff.newFilesCount << " new, " << diff.missingFilesCount
            << " missing, " << diff.matchedFilesCount << " matched, "
            << diff.errorCount << " errors" << std::endl;
  return diff;
}

SyncReport ReconciliationSession::cancelledReport(const ScanOutcome &scan) {
  SyncReport report;
  report.rootFolderPath = scan.root;
  report.scanWarnings = scan.warnings;
  report.totalScanned = static_cast<int>(scan.files.size());
  report.cancelled = true;
  transition(SessionState::Completed);
  return report;
}

SyncReport ReconciliationSession::runApply(const ScanOutcome &scan,
                                           const SyncSelection &selection) {
  transition(SessionState::Applying);

  // Only Missing clips may go; a clip whose file was just scanned stays.
  std::map<int64_t, std::string> present;
  for (const auto &item : m_diff->items) {
    if (item.status() == ReconciliationStatus::Matched)
      present.emplace(*item.catalogId(), item.filePath);
  }

  SyncReport report;
  try {
    report = m_executor.apply(selection, scan.root, &m_cancel, &present);
  } catch (const CatalogUnavailableError &e) {
    std::cerr << "[Session] " << e.what() << std::endl;
    transition(SessionState::Failed);
    throw;
  }
  report.totalScanned = static_cast<int>(scan.files.size());
  report.scanWarnings = scan.warnings;
  transition(SessionState::Completed);
  return report;
}

PreviewReport ReconciliationSession::preview(const std::string &rootFolderPath) {
  RunScope run{m_cancel};
  m_diff.reset();
  ScanOutcome scan = runScan(rootFolderPath);

  PreviewReport report;
  report.rootFolderPath = scan.root;
  report.scanWarnings = scan.warnings;
  if (scan.cancelled) {
    // A partial scan would report every unscanned clip as Missing.
    report.cancelled = true;
    report.diff.totalScanned = static_cast<int>(scan.files.size());
    transition(SessionState::Completed);
    return report;
  }

  report.diff = runDiff(scan.files);
  m_diff = report.diff;
  transition(SessionState::Ready);
  return report;
}

SyncReport ReconciliationSession::apply(const std::string &rootFolderPath,
                                        const SyncSelection &selection) {
  RunScope run{m_cancel};
  m_diff.reset();
  ScanOutcome scan = runScan(rootFolderPath);
  if (scan.cancelled)
    return cancelledReport(scan);

  m_diff = runDiff(scan.files);
  transition(SessionState::Ready);
  return runApply(scan, selection);
}

SyncReport ReconciliationSession::fullSync(const std::string &rootFolderPath) {
  RunScope run{m_cancel};
  m_diff.reset();
  ScanOutcome scan = runScan(rootFolderPath);
  if (scan.cancelled)
    return cancelledReport(scan);

  m_diff = runDiff(scan.files);
  return runApply(scan, selectAll(*m_diff));
}

SyncSelection ReconciliationSession::selectAll(const ReconciliationDiff &diff) {
  SyncSelection selection;
  for (const auto &item : diff.items) {
    switch (item.status()) {
    case ReconciliationStatus::New:
      selection.filesToAdd.push_back(item.filePath);
      break;
    case ReconciliationStatus::Missing:
      selection.clipIdsToRemove.push_back(*item.catalogId());
      break;
    default:
      break;
    }
  }
  return selection;
}

} // namespace clipsync
