#pragma once
#include "CatalogStore.hpp"
#include "PathNormalizer.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipsync {

/**
 * SQLite-backed catalog (sqlite_orm). Clips carry a unique location key
 * derived with the same PathNormalizer the scanner uses, so a file can be
 * registered only once however its path is spelled.
 */
class DatabaseManager : public CatalogStore {
public:
  DatabaseManager(const std::string &dbPath, bool caseInsensitivePaths = true);
  ~DatabaseManager() override;

  // Connection management
  bool open();
  void close();
  void initializeSchema();

  // CatalogStore
  std::optional<std::vector<CatalogEntry>> listLocalEntries() override;
  CreateResult createEntry(const std::string &locationKey,
                           const std::string &title,
                           int32_t durationSeconds) override;
  // Local clips only; any other id is NotFound.
  DeleteResult deleteEntry(int64_t id) override;
  bool updateThumbnail(int64_t id, const std::string &thumbnailPath) override;
  std::optional<std::string> getSetting(const std::string &key) override;
  bool putSetting(const std::string &key, const std::string &value) override;

  // Maps a (possibly extended) SQLite result code to a catalog status.
  static CatalogStatus statusForSqliteCode(int code);

  // Clip operations outside the reconciliation contract
  std::optional<CatalogEntry> getEntry(int64_t id);
  std::optional<std::vector<CatalogEntry>> getAllEntries();
  std::optional<int64_t> importEntry(const CatalogEntry &entry);
  bool tagEntry(int64_t clipId, const std::string &category,
                const std::string &value);

private:
  std::string m_dbPath;
  PathNormalizer m_normalizer;
  struct Impl;
  std::unique_ptr<Impl> m_impl;

  std::string locationKeyFor(const CatalogEntry &entry) const;
};

} // namespace clipsync
