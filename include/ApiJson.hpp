#pragma once
#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace clipsync {

/**
 * JSON shapes of the HTTP API and of the CLI's printed reports.
 * Field names are camelCase.
 */
namespace ApiJson {

const char *statusName(ReconciliationStatus status);

// Unix seconds to "YYYY-MM-DDTHH:MM:SSZ".
std::string formatTimestamp(int64_t unixSeconds);

nlohmann::json toJson(const ReconciliationItem &item);
nlohmann::json toJson(const PreviewReport &report);
nlohmann::json toJson(const SyncOutcome &outcome);
nlohmann::json toJson(const SyncReport &report);

// Body of POST /api/clips/selective-sync. Missing arrays are empty.
// Throws std::invalid_argument when the body is not an object and
// nlohmann::json::exception on mistyped fields.
SyncSelection parseSelection(const nlohmann::json &body);

// rootFolderPath field of a request body, empty when absent or null.
std::string rootFolderOf(const nlohmann::json &body);

} // namespace ApiJson

} // namespace clipsync
