#pragma once
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

enum class CatalogStatus { Ok, Duplicate, NotFound, Unavailable, Failed };

struct CreateResult {
  CatalogStatus status = CatalogStatus::Failed;
  int64_t id = 0;
  std::string message;
};

struct DeleteResult {
  CatalogStatus status = CatalogStatus::Failed;
  CatalogEntry removed;
  std::string message;
};

/**
 * Contract of the catalog that owns clip records. The reconciliation engine
 * only reads snapshots and issues single-entry writes through it.
 */
class CatalogStore {
public:
  virtual ~CatalogStore() = default;

  // Local-storage clips with tags. nullopt when the store is unreachable.
  virtual std::optional<std::vector<CatalogEntry>> listLocalEntries() = 0;

  // Creates a Local clip. Duplicate when a clip with the same location key
  // already exists.
  virtual CreateResult createEntry(const std::string &locationKey,
                                   const std::string &title,
                                   int32_t durationSeconds) = 0;

  // Deletes a Local clip and its tag links. NotFound when the id is unknown
  // or names a clip of another storage type.
  virtual DeleteResult deleteEntry(int64_t id) = 0;

  virtual bool updateThumbnail(int64_t id, const std::string &thumbnailPath) = 0;

  // Key/value settings persisted next to the clips.
  virtual std::optional<std::string> getSetting(const std::string &key) = 0;
  virtual bool putSetting(const std::string &key, const std::string &value) = 0;
};

} // namespace clipsync
