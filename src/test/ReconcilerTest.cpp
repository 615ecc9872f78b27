#include "Reconciler.hpp"
#include "TestFakes.hpp"
#include <set>

using namespace clipsync;
using clipsync::test::check;

namespace {

ScannedFile scanned(const std::string &path) {
  PathNormalizer normalizer;
  ScannedFile file;
  file.path = path;
  file.key = normalizer.normalize(path);
  file.directory = std::filesystem::path(path).parent_path().generic_string();
  file.filename = std::filesystem::path(path).filename().generic_string();
  file.sizeBytes = 100;
  file.modifiedAt = 1700000000;
  return file;
}

CatalogEntry entry(int64_t id, const std::string &location,
                   StorageType type = StorageType::Local) {
  CatalogEntry e;
  e.id = id;
  e.storageType = type;
  e.locationKey = location;
  e.title = "clip" + std::to_string(id);
  return e;
}

const ReconciliationItem *findItem(const ReconciliationDiff &diff,
                                   const std::string &path) {
  for (const auto &item : diff.items) {
    if (item.filePath == path)
      return &item;
  }
  return nullptr;
}

int catalogOnly(const ReconciliationDiff &diff) {
  return diff.missingFilesCount + diff.errorCount;
}

bool countsAddUp(const ReconciliationDiff &diff, int catalogSideErrors) {
  int sum = diff.newFilesCount + diff.missingFilesCount +
            diff.matchedFilesCount + diff.errorCount;
  return sum == static_cast<int>(diff.items.size()) &&
         static_cast<int>(diff.items.size()) ==
             diff.totalScanned + diff.missingFilesCount + catalogSideErrors;
}

} // namespace

int main() {
  std::cout << "[Test] Starting Reconciler Test..." << std::endl;
  Reconciler reconciler;

  // Empty catalog: everything on disk is new
  {
    auto diff = reconciler.diff({scanned("/lib/a.mp4"), scanned("/lib/b.mov")}, {});
    check(diff.newFilesCount == 2 && diff.missingFilesCount == 0 &&
              diff.matchedFilesCount == 0 && diff.errorCount == 0,
          "empty catalog gives two new files");
    check(diff.totalScanned == 2, "total scanned counted");
    const auto *a = findItem(diff, "/lib/a.mp4");
    check(a && a->status() == ReconciliationStatus::New, "a.mp4 is new");
    check(a && !a->catalogId().has_value(), "new item has no catalog id");
    check(a && std::get<NewFile>(a->detail).directory == "/lib",
          "new item carries its directory");
  }

  // Matched, new and missing together
  {
    auto diff = reconciler.diff({scanned("/lib/a.mp4"), scanned("/lib/b.mov")},
                                {entry(1, "/lib/a.mp4"), entry(2, "/lib/c.mp4")});
    const auto *a = findItem(diff, "/lib/a.mp4");
    const auto *b = findItem(diff, "/lib/b.mov");
    const auto *c = findItem(diff, "/lib/c.mp4");
    check(a && a->status() == ReconciliationStatus::Matched, "a.mp4 matched");
    check(a && a->catalogId() == 1, "matched item carries the clip id");
    check(a && std::get<MatchedFile>(a->detail).clip.title == "clip1",
          "matched item carries the clip title");
    check(b && b->status() == ReconciliationStatus::New, "b.mov new");
    check(c && c->status() == ReconciliationStatus::Missing, "c.mp4 missing");
    check(c && c->catalogId() == 2, "missing item carries the clip id");
    check(diff.items.size() == 3, "one item per path");
    check(countsAddUp(diff, 0), "counts add up");
  }

  // Keys compare case- and separator-insensitively
  {
    auto diff = reconciler.diff({scanned("/Lib/Sub/A.MP4")},
                                {entry(7, "\\lib\\sub\\a.mp4")});
    check(diff.matchedFilesCount == 1 && diff.missingFilesCount == 0 &&
              diff.newFilesCount == 0,
          "differently spelled location still matches");
    check(diff.items.size() == 1 && diff.items[0].filePath == "/Lib/Sub/A.MP4",
          "matched item reports the path as found on disk");
  }

  // Duplicate catalog entries for one file
  {
    auto diff = reconciler.diff({scanned("/lib/a.mp4")},
                                {entry(1, "/lib/a.mp4"), entry(2, "/LIB/A.mp4")});
    check(diff.matchedFilesCount == 1, "first entry wins the match");
    check(diff.errorCount == 1, "second entry reported as an error");
    bool sawError = false;
    for (const auto &item : diff.items) {
      if (item.status() == ReconciliationStatus::Error) {
        sawError = true;
        check(!item.catalogId().has_value(), "error item carries no catalog id");
        check(std::get<ErrorEntry>(item.detail).errorMessage.find("clip 2") !=
                  std::string::npos,
              "error names the duplicate clip");
      }
    }
    check(sawError, "error item present");
    check(countsAddUp(diff, 1), "counts add up with a catalog-side error");
  }

  // Malformed catalog location
  {
    auto diff = reconciler.diff({}, {entry(5, "relative/clip.mp4")});
    check(diff.errorCount == 1 && diff.missingFilesCount == 0,
          "malformed location is an error, not missing");
    check(catalogOnly(diff) == 1, "catalog-only count includes the error");
  }

  // Non-local entries are ignored
  {
    auto diff = reconciler.diff(
        {}, {entry(3, "https://www.youtube.com/watch?v=abc", StorageType::YouTube)});
    check(diff.items.empty(), "remote clips never reconciled");
  }

  // Disjointness across a larger mixed set
  {
    std::vector<ScannedFile> files;
    std::vector<CatalogEntry> entries;
    for (int i = 0; i < 20; ++i)
      files.push_back(scanned("/lib/f" + std::to_string(i) + ".mp4"));
    for (int i = 10; i < 30; ++i)
      entries.push_back(entry(i, "/lib/F" + std::to_string(i) + ".MP4"));
    auto diff = reconciler.diff(files, entries);

    std::set<std::string> seen;
    bool disjoint = true;
    PathNormalizer normalizer;
    for (const auto &item : diff.items) {
      if (!seen.insert(normalizer.normalize(item.filePath)).second)
        disjoint = false;
    }
    check(disjoint, "no path appears twice");
    check(diff.newFilesCount == 10 && diff.matchedFilesCount == 10 &&
              diff.missingFilesCount == 10,
          "overlap classified");
    check(countsAddUp(diff, 0), "counts add up on the mixed set");

    auto again = reconciler.diff(files, entries);
    bool same = again.items.size() == diff.items.size();
    for (std::size_t i = 0; same && i < diff.items.size(); ++i)
      same = again.items[i].filePath == diff.items[i].filePath &&
             again.items[i].status() == diff.items[i].status();
    check(same, "diff is deterministic");
  }

  return clipsync::test::finish("Reconciler Test");
}
