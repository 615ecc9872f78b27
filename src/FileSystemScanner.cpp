#include "FileSystemScanner.hpp"
#include "Errors.hpp"
#include "LogUtils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>

namespace fs = std::filesystem;

namespace clipsync {

ScanCursor::ScanCursor(std::string root, PathNormalizer normalizer,
                       const CancellationFlag *cancel)
    : m_root(std::move(root)), m_normalizer(normalizer), m_cancel(cancel) {
  std::error_code ec;
  fs::directory_iterator it(m_root, fs::directory_options::none, ec);
  if (ec) {
    addWarning(m_root, ec);
    return;
  }
  m_stack.push_back(std::move(it));
}

void ScanCursor::addWarning(const fs::path &path, const std::error_code &ec) {
  std::string warning = "ScanEntryUnreadable: " + path.generic_string() +
                        " - " + ec.message();
  std::cerr << "[Scanner] Skipping unreadable entry: "
            << LogUtils::sanitizePath(path.generic_string()) << " - "
            << ec.message() << std::endl;
  m_warnings.push_back(std::move(warning));
}

std::optional<ScannedFile> ScanCursor::next() {
  while (!m_stack.empty()) {
    if (m_cancel && m_cancel->isCancelled()) {
      std::cout << "[Scanner] Scan cancelled after " << m_scannedCount
                << " files" << std::endl;
      m_cancelled = true;
      m_stack.clear();
      return std::nullopt;
    }

    auto &it = m_stack.back();
    if (it == fs::directory_iterator()) {
      m_stack.pop_back();
      continue;
    }

    fs::directory_entry entry = *it;
    std::error_code ec;
    it.increment(ec);
    if (ec) {
      // The rest of this directory is unreadable; keep what we already have.
      addWarning(entry.path().parent_path(), ec);
      m_stack.pop_back();
    }

    auto status = entry.symlink_status(ec);
    if (ec) {
      addWarning(entry.path(), ec);
      continue;
    }

    if (fs::is_directory(status)) {
      fs::directory_iterator child(entry.path(), fs::directory_options::none,
                                   ec);
      if (ec) {
        addWarning(entry.path(), ec);
        continue;
      }
      m_stack.push_back(std::move(child));
      continue;
    }

    if (fs::is_symlink(status)) {
      // Linked files count, linked directories are never descended.
      status = entry.status(ec);
      if (ec) {
        addWarning(entry.path(), ec);
        continue;
      }
    }

    if (!fs::is_regular_file(status) ||
        !FileSystemScanner::isVideoFile(entry.path()))
      continue;

    auto size = fs::file_size(entry.path(), ec);
    if (ec) {
      addWarning(entry.path(), ec);
      continue;
    }
    auto mtime = fs::last_write_time(entry.path(), ec);
    if (ec) {
      addWarning(entry.path(), ec);
      continue;
    }

    ScannedFile file;
    try {
      file.path = m_normalizer.normalizePath(entry.path().generic_string());
    } catch (const InvalidPathError &) {
      addWarning(entry.path(),
                 std::make_error_code(std::errc::invalid_argument));
      continue;
    }
    file.key = m_normalizer.keyFor(file.path);
    fs::path normalized{file.path};
    file.directory = normalized.parent_path().generic_string();
    file.filename = normalized.filename().generic_string();
    file.sizeBytes = static_cast<uint64_t>(size);
    file.modifiedAt = FileSystemScanner::getUnixTimeStamp(mtime);
    ++m_scannedCount;
    return file;
  }
  return std::nullopt;
}

FileSystemScanner::FileSystemScanner(PathNormalizer normalizer)
    : m_normalizer(normalizer) {}

FileSystemScanner::~FileSystemScanner() = default;

const std::vector<std::string> &FileSystemScanner::videoExtensions() {
  static const std::vector<std::string> extensions = {".mp4", ".webm", ".ogg",
                                                      ".mov", ".avi"};
  return extensions;
}

bool FileSystemScanner::isVideoFile(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  const auto &allowed = videoExtensions();
  return std::find(allowed.begin(), allowed.end(), ext) != allowed.end();
}

std::int64_t
FileSystemScanner::getUnixTimeStamp(const fs::file_time_type &ftime) {
  auto now_file = fs::file_time_type::clock::now();
  auto now_sys = std::chrono::system_clock::now();
  auto file_duration = ftime - now_file;
  auto sys_time =
      now_sys + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                    file_duration);
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys_time.time_since_epoch())
      .count();
}

std::string FileSystemScanner::validateRoot(const std::string &rootFolder) const {
  bool blank = std::all_of(rootFolder.begin(), rootFolder.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
  if (blank)
    throw RootNotFoundError("Root folder path is required");

  std::string root;
  try {
    root = m_normalizer.normalizePath(rootFolder);
  } catch (const InvalidPathError &) {
    throw RootNotFoundError("Root folder path must be an absolute path");
  }

  std::error_code ec;
  if (!fs::exists(root, ec))
    throw RootNotFoundError("Root folder does not exist");
  if (!fs::is_directory(root, ec))
    throw RootNotFoundError("Root folder is not a directory");
  return root;
}

ScanCursor FileSystemScanner::scan(const std::string &rootFolder,
                                   const CancellationFlag *cancel) const {
  std::string root = validateRoot(rootFolder);
  std::cout << "[Scanner] Scanning " << LogUtils::sanitizePath(root)
            << std::endl;
  return ScanCursor(root, m_normalizer, cancel);
}

} // namespace clipsync
