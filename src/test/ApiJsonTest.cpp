#include "ApiJson.hpp"
#include "TestFakes.hpp"

using namespace clipsync;
using clipsync::test::check;
using json = nlohmann::json;

int main() {
  std::cout << "[Test] Starting ApiJson Test..." << std::endl;

  check(ApiJson::formatTimestamp(0) == "1970-01-01T00:00:00Z", "epoch formatted");
  check(ApiJson::formatTimestamp(1700000000) == "2023-11-14T22:13:20Z",
        "timestamp formatted as UTC");

  // Items
  ReconciliationItem fresh{"/lib/b.mov", NewFile{"/lib", 2048, 1700000000}};
  json j = ApiJson::toJson(fresh);
  check(j["status"] == "new" && j["fileSizeBytes"] == 2048 &&
            j["lastModified"] == "2023-11-14T22:13:20Z" && !j.contains("catalogId"),
        "new item serialized");

  ClipSummary clip{7, "Title", "Desc", {Tag{1, "Genre", "Drama"}}};
  ReconciliationItem missing{"/lib/c.mp4", MissingClip{clip}};
  j = ApiJson::toJson(missing);
  check(j["status"] == "missing" && j["catalogId"] == 7 &&
            j["tags"].size() == 1 && j["tags"][0]["value"] == "Drama" &&
            !j.contains("fileSizeBytes"),
        "missing item serialized");

  ReconciliationItem matched{"/lib/a.mp4", MatchedFile{"/lib", 10, 0, clip}};
  check(ApiJson::toJson(matched)["status"] == "matched", "matched status name");

  ReconciliationItem error{"/lib/x.mp4", ErrorEntry{"Duplicate file"}};
  j = ApiJson::toJson(error);
  check(j["status"] == "error" && j["errorMessage"] == "Duplicate file" &&
            !j.contains("catalogId"),
        "error item serialized");

  // Preview
  PreviewReport preview;
  preview.rootFolderPath = "/lib";
  preview.diff.items = {fresh, missing};
  preview.diff.totalScanned = 1;
  preview.diff.newFilesCount = 1;
  preview.diff.missingFilesCount = 1;
  j = ApiJson::toJson(preview);
  check(j["items"].size() == 2 && j["totalScanned"] == 1 &&
            j["newFilesCount"] == 1 && j["missingFilesCount"] == 1 &&
            j["matchedFilesCount"] == 0 && j["errorCount"] == 0 &&
            j["rootFolderPath"] == "/lib",
        "preview serialized");

  // Sync report
  SyncReport report;
  SyncOutcome added;
  added.filePath = "/lib/b.mov";
  added.clipId = 3;
  added.title = "b";
  added.outcome = SyncOutcomeKind::Added;
  added.warnings = {"Thumbnail generation failed: ffmpeg not found"};
  SyncOutcome failed;
  failed.clipId = 99;
  failed.errorMessage = "Clip with ID 99 not found";
  report.addedClips = {added};
  report.errors = {failed};
  report.totalAdded = 1;
  report.processed = 2;
  j = ApiJson::toJson(report);
  check(j["addedClips"][0]["clipId"] == 3 &&
            j["addedClips"][0]["warnings"].size() == 1,
        "added clip carries its warnings");
  check(j["errors"][0]["outcome"] == "failed" &&
            j["errors"][0]["errorMessage"] == "Clip with ID 99 not found",
        "failure serialized");
  check(j["errors"][0]["warnings"].is_array() &&
            j["errors"][0]["warnings"].empty(),
        "failure without warnings has an empty list");

  // A duplicate found after a failed metadata read keeps the warning
  SyncOutcome duplicate;
  duplicate.filePath = "/lib/a.mp4";
  duplicate.outcome = SyncOutcomeKind::Failed;
  duplicate.errorMessage = "A clip with this file path already exists";
  duplicate.warnings = {"Metadata probe failed: ffprobe not found"};
  json dj = ApiJson::toJson(duplicate);
  check(dj["outcome"] == "failed" && dj["warnings"].size() == 1 &&
            dj["warnings"][0] == "Metadata probe failed: ffprobe not found",
        "failure carries its warnings");

  check(j["totalAdded"] == 1 && j["totalRemoved"] == 0 && j["processed"] == 2 &&
            j["cancelled"] == false,
        "aggregate counts serialized");

  // Requests
  auto selection = ApiJson::parseSelection(json::parse(
      R"({"rootFolderPath":"/lib","filesToAdd":["/lib/b.mov"],"clipIdsToRemove":[4,5]})"));
  check(selection.filesToAdd.size() == 1 && selection.clipIdsToRemove.size() == 2 &&
            selection.clipIdsToRemove[1] == 5,
        "selection parsed");
  check(ApiJson::parseSelection(json::object()).filesToAdd.empty(),
        "absent arrays are empty");
  check(ApiJson::rootFolderOf(json::parse(R"({"rootFolderPath":"/lib"})")) == "/lib",
        "root folder read");
  check(ApiJson::rootFolderOf(json::parse(R"({"rootFolderPath":null})")).empty(),
        "null root folder is empty");

  bool rejected = false;
  try {
    ApiJson::parseSelection(json::parse(R"({"clipIdsToRemove":["x"]})"));
  } catch (const json::exception &) {
    rejected = true;
  }
  check(rejected, "mistyped ids rejected");

  return clipsync::test::finish("ApiJson Test");
}
