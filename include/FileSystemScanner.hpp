#ifndef FILESYSTEMSCANNER_HPP
#define FILESYSTEMSCANNER_HPP

#include "CancellationFlag.hpp"
#include "PathNormalizer.hpp"
#include "types.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

/**
 * ScanCursor is a lazy, one-shot walk over a root folder. Each call to next()
 * advances to the following video file. Unreadable entries are skipped and
 * collected as warnings. Once exhausted (or cancelled) it stays exhausted.
 */
class ScanCursor {
public:
  ScanCursor(ScanCursor &&) = default;
  ScanCursor &operator=(ScanCursor &&) = default;
  ScanCursor(const ScanCursor &) = delete;
  ScanCursor &operator=(const ScanCursor &) = delete;

  std::optional<ScannedFile> next();

  const std::string &root() const { return m_root; }
  const std::vector<std::string> &warnings() const { return m_warnings; }
  std::size_t scannedCount() const { return m_scannedCount; }
  bool exhausted() const { return m_stack.empty(); }
  bool cancelled() const { return m_cancelled; }

private:
  friend class FileSystemScanner;
  ScanCursor(std::string root, PathNormalizer normalizer,
             const CancellationFlag *cancel);

  void addWarning(const std::filesystem::path &path, const std::error_code &ec);

  std::string m_root;
  PathNormalizer m_normalizer;
  const CancellationFlag *m_cancel;
  std::vector<std::filesystem::directory_iterator> m_stack;
  std::vector<std::string> m_warnings;
  std::size_t m_scannedCount = 0;
  bool m_cancelled = false;
};

class FileSystemScanner {
public:
  explicit FileSystemScanner(PathNormalizer normalizer = PathNormalizer());
  ~FileSystemScanner();

  // Throws RootNotFoundError when the root is empty, relative, missing or not
  // a directory.
  ScanCursor scan(const std::string &rootFolder,
                  const CancellationFlag *cancel = nullptr) const;

  // Returns the normalized root or throws RootNotFoundError.
  std::string validateRoot(const std::string &rootFolder) const;

  static bool isVideoFile(const std::filesystem::path &path);
  static const std::vector<std::string> &videoExtensions();
  static std::int64_t
  getUnixTimeStamp(const std::filesystem::file_time_type &ftime);

private:
  PathNormalizer m_normalizer;
};

} // namespace clipsync

#endif // FILESYSTEMSCANNER_HPP
