#include "Errors.hpp"
#include "FileSystemScanner.hpp"
#include "TestFakes.hpp"
#include <algorithm>
#include <set>

using namespace clipsync;
using clipsync::test::check;
using clipsync::test::TempDir;

namespace {

std::vector<ScannedFile> drain(ScanCursor &cursor) {
  std::vector<ScannedFile> files;
  while (auto file = cursor.next())
    files.push_back(*file);
  return files;
}

std::string rootError(const FileSystemScanner &scanner, const std::string &root) {
  try {
    scanner.scan(root);
  } catch (const RootNotFoundError &e) {
    return e.what();
  }
  return "";
}

} // namespace

int main() {
  std::cout << "[Test] Starting FileSystemScanner Test..." << std::endl;

  FileSystemScanner scanner;

  // Recursive walk, extension filter
  {
    TempDir dir("clipsync_scan");
    dir.touch("a.mp4", "12345");
    dir.touch("b.MOV");
    dir.touch("notes.txt");
    dir.touch("nested/deeper/c.webm");
    dir.touch("nested/d.avi");
    dir.touch("nested/e.ogg");
    dir.touch("nested/cover.jpg");

    ScanCursor cursor = scanner.scan(dir.path());
    auto files = drain(cursor);

    std::set<std::string> names;
    for (const auto &f : files)
      names.insert(f.filename);
    check(files.size() == 5, "five video files found");
    check(names.count("b.MOV") == 1, "extension match ignores case");
    check(names.count("notes.txt") == 0 && names.count("cover.jpg") == 0,
          "non-video files skipped");
    check(cursor.exhausted(), "cursor exhausted after walk");
    check(cursor.scannedCount() == 5, "scanned count matches");
    check(cursor.warnings().empty(), "no warnings on a readable tree");
    check(!cursor.next().has_value(), "exhausted cursor stays exhausted");

    auto a = std::find_if(files.begin(), files.end(),
                          [](const ScannedFile &f) { return f.filename == "a.mp4"; });
    check(a != files.end() && a->sizeBytes == 5, "file size recorded");
    check(a != files.end() && a->directory == cursor.root(),
          "directory is the containing folder");
    check(a != files.end() && a->key == PathNormalizer().normalize(a->path),
          "key derived with the normalizer");
    check(a != files.end() && a->modifiedAt > 0, "modification time recorded");
  }

  // Empty folder
  {
    TempDir dir("clipsync_scan_empty");
    ScanCursor cursor = scanner.scan(dir.path());
    check(!cursor.next().has_value(), "empty folder yields nothing");
  }

  // Root validation
  {
    TempDir dir("clipsync_scan_root");
    std::string file = dir.touch("a.mp4");
    check(rootError(scanner, "") == "Root folder path is required",
          "empty root rejected");
    check(rootError(scanner, "relative/clips") ==
              "Root folder path must be an absolute path",
          "relative root rejected");
    check(rootError(scanner, dir.path() + "/missing") ==
              "Root folder does not exist",
          "missing root rejected");
    check(rootError(scanner, file) == "Root folder is not a directory",
          "file as root rejected");
    check(scanner.validateRoot(dir.path() + "/") == dir.path(),
          "root normalized");
  }

  // Symlinked directories are not followed
  {
    TempDir dir("clipsync_scan_links");
    TempDir outside("clipsync_scan_outside");
    dir.touch("a.mp4");
    outside.touch("far.mp4");
    std::error_code ec;
    std::filesystem::create_directory_symlink(outside.path(),
                                              dir.path() + "/link", ec);
    if (!ec) {
      ScanCursor cursor = scanner.scan(dir.path());
      auto files = drain(cursor);
      check(files.size() == 1, "linked directory not descended");
    }
  }

  // Unreadable subdirectory becomes a warning
  {
    TempDir dir("clipsync_scan_perm");
    dir.touch("ok.mp4");
    std::string locked = dir.mkdir("locked");
    dir.touch("locked/hidden.mp4");
    std::filesystem::permissions(locked, std::filesystem::perms::none);

    bool enforced = false;
    {
      std::error_code ec;
      std::filesystem::directory_iterator probe(locked, ec);
      enforced = static_cast<bool>(ec); // root ignores permission bits
    }
    if (enforced) {
      ScanCursor cursor = scanner.scan(dir.path());
      auto files = drain(cursor);
      check(files.size() == 1, "readable file still found");
      check(cursor.warnings().size() == 1 &&
                cursor.warnings()[0].rfind("ScanEntryUnreadable: ", 0) == 0,
            "unreadable directory reported as warning");
    }
    std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
  }

  // Cancellation between entries
  {
    TempDir dir("clipsync_scan_cancel");
    for (int i = 0; i < 10; ++i)
      dir.touch("clip" + std::to_string(i) + ".mp4");
    CancellationFlag cancel;
    ScanCursor cursor = scanner.scan(dir.path(), &cancel);
    auto first = cursor.next();
    cancel.cancel();
    auto second = cursor.next();
    check(first.has_value() && !second.has_value(), "scan stops when cancelled");
    check(cursor.cancelled() && cursor.scannedCount() == 1,
          "cancelled cursor reports progress");
  }

  return clipsync::test::finish("FileSystemScanner Test");
}
