#include "ApiJson.hpp"
#include <ctime>
#include <stdexcept>
#include <type_traits>
#include <variant>

using json = nlohmann::json;

namespace clipsync {
namespace ApiJson {

namespace {

json tagsToJson(const std::vector<Tag> &tags) {
  json arr = json::array();
  for (const auto &tag : tags) {
    arr.push_back({{"id", tag.id}, {"category", tag.category}, {"value", tag.value}});
  }
  return arr;
}

json strings(const std::vector<std::string> &values) {
  json arr = json::array();
  for (const auto &v : values)
    arr.push_back(v);
  return arr;
}

json outcomes(const std::vector<SyncOutcome> &values) {
  json arr = json::array();
  for (const auto &v : values)
    arr.push_back(toJson(v));
  return arr;
}

void putClip(json &j, const ClipSummary &clip) {
  j["catalogId"] = clip.catalogId;
  j["title"] = clip.title;
  j["description"] = clip.description;
  j["tags"] = tagsToJson(clip.tags);
}

} // namespace

const char *statusName(ReconciliationStatus status) {
  switch (status) {
  case ReconciliationStatus::New:
    return "new";
  case ReconciliationStatus::Missing:
    return "missing";
  case ReconciliationStatus::Matched:
    return "matched";
  case ReconciliationStatus::Error:
    return "error";
  }
  return "error";
}

std::string formatTimestamp(int64_t unixSeconds) {
  std::time_t t = static_cast<std::time_t>(unixSeconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

json toJson(const ReconciliationItem &item) {
  json j;
  j["filePath"] = item.filePath;
  j["status"] = statusName(item.status());

  std::visit(
      [&j](const auto &detail) {
        using T = std::decay_t<decltype(detail)>;
        if constexpr (std::is_same_v<T, NewFile>) {
          j["directory"] = detail.directory;
          j["fileSizeBytes"] = detail.fileSizeBytes;
          j["lastModified"] = formatTimestamp(detail.modifiedAt);
        } else if constexpr (std::is_same_v<T, MissingClip>) {
          putClip(j, detail.clip);
        } else if constexpr (std::is_same_v<T, MatchedFile>) {
          j["directory"] = detail.directory;
          j["fileSizeBytes"] = detail.fileSizeBytes;
          j["lastModified"] = formatTimestamp(detail.modifiedAt);
          putClip(j, detail.clip);
        } else {
          j["errorMessage"] = detail.errorMessage;
        }
      },
      item.detail);
  return j;
}

json toJson(const PreviewReport &report) {
  const auto &diff = report.diff;
  json items = json::array();
  for (const auto &item : diff.items)
    items.push_back(toJson(item));

  json j;
  j["rootFolderPath"] = report.rootFolderPath;
  j["items"] = items;
  j["totalScanned"] = diff.totalScanned;
  j["newFilesCount"] = diff.newFilesCount;
  j["missingFilesCount"] = diff.missingFilesCount;
  j["matchedFilesCount"] = diff.matchedFilesCount;
  j["errorCount"] = diff.errorCount;
  j["scanWarnings"] = strings(report.scanWarnings);
  j["cancelled"] = report.cancelled;
  return j;
}

json toJson(const SyncOutcome &outcome) {
  json j;
  j["filePath"] = outcome.filePath;
  if (outcome.clipId)
    j["clipId"] = *outcome.clipId;
  else
    j["clipId"] = nullptr;
  j["title"] = outcome.title;
  j["warnings"] = strings(outcome.warnings);
  switch (outcome.outcome) {
  case SyncOutcomeKind::Added:
    j["outcome"] = "added";
    break;
  case SyncOutcomeKind::Removed:
    j["outcome"] = "removed";
    break;
  case SyncOutcomeKind::Failed:
    j["outcome"] = "failed";
    j["errorMessage"] = outcome.errorMessage;
    break;
  }
  return j;
}

json toJson(const SyncReport &report) {
  json j;
  j["rootFolderPath"] = report.rootFolderPath;
  j["addedClips"] = outcomes(report.addedClips);
  j["removedClips"] = outcomes(report.removedClips);
  j["errors"] = outcomes(report.errors);
  j["scanWarnings"] = strings(report.scanWarnings);
  j["totalScanned"] = report.totalScanned;
  j["totalAdded"] = report.totalAdded;
  j["totalRemoved"] = report.totalRemoved;
  j["processed"] = report.processed;
  j["cancelled"] = report.cancelled;
  return j;
}

SyncSelection parseSelection(const json &body) {
  SyncSelection selection;
  if (!body.is_object())
    throw std::invalid_argument("Request body must be a JSON object");
  if (body.contains("filesToAdd") && !body["filesToAdd"].is_null())
    selection.filesToAdd = body["filesToAdd"].get<std::vector<std::string>>();
  if (body.contains("clipIdsToRemove") && !body["clipIdsToRemove"].is_null())
    selection.clipIdsToRemove =
        body["clipIdsToRemove"].get<std::vector<int64_t>>();
  return selection;
}

std::string rootFolderOf(const json &body) {
  if (body.is_object() && body.contains("rootFolderPath") &&
      body["rootFolderPath"].is_string())
    return body["rootFolderPath"].get<std::string>();
  return "";
}

} // namespace ApiJson
} // namespace clipsync
