#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "LogUtils.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <sqlite3.h>
#include <sqlite_orm/sqlite_orm.h>
#include <system_error>

using namespace sqlite_orm;

namespace clipsync {

namespace {

struct ClipRecord {
  int64_t id = 0;
  std::string title;
  std::string description;
  int storageType = 0;
  std::string locationString;
  std::string locationKey;
  int32_t duration = 0;
  std::optional<std::string> thumbnailPath;
};

struct TagRecord {
  int64_t id = 0;
  std::string category;
  std::string value;
};

struct ClipTagRecord {
  int64_t clipId = 0;
  int64_t tagId = 0;
};

struct SettingRecord {
  std::string key;
  std::string value;
};

CatalogStatus statusFor(const std::system_error &e) {
  if (e.code().category() != get_sqlite_error_category())
    return CatalogStatus::Failed;
  return DatabaseManager::statusForSqliteCode(e.code().value());
}

CatalogEntry toEntry(const ClipRecord &r) {
  CatalogEntry entry;
  entry.id = r.id;
  entry.storageType = static_cast<StorageType>(r.storageType);
  entry.locationKey = r.locationString;
  entry.title = r.title;
  entry.description = r.description;
  entry.durationSeconds = r.duration;
  entry.thumbnailPath = r.thumbnailPath;
  return entry;
}

} // namespace

// We define a helper function to create the storage.
// This helps us deduce the complex template type of the storage.
inline auto create_storage_impl(const std::string &path) {
  return make_storage(
      path,
      make_table<ClipRecord>(
          "Clip",
          make_column("id", &ClipRecord::id, primary_key().autoincrement()),
          make_column("title", &ClipRecord::title),
          make_column("description", &ClipRecord::description),
          make_column("storage_type", &ClipRecord::storageType),
          make_column("location_string", &ClipRecord::locationString),
          make_column("location_key", &ClipRecord::locationKey, unique()),
          make_column("duration", &ClipRecord::duration),
          make_column("thumbnail_path", &ClipRecord::thumbnailPath)),
      make_table<TagRecord>(
          "Tag",
          make_column("id", &TagRecord::id, primary_key().autoincrement()),
          make_column("category", &TagRecord::category),
          make_column("value", &TagRecord::value),
          sqlite_orm::unique(&TagRecord::category, &TagRecord::value)),
      make_table<ClipTagRecord>(
          "ClipTag", make_column("clip_id", &ClipTagRecord::clipId),
          make_column("tag_id", &ClipTagRecord::tagId),
          primary_key(&ClipTagRecord::clipId, &ClipTagRecord::tagId),
          foreign_key(&ClipTagRecord::clipId).references(&ClipRecord::id),
          foreign_key(&ClipTagRecord::tagId).references(&TagRecord::id)),
      make_table<SettingRecord>(
          "Setting", make_column("key", &SettingRecord::key, primary_key()),
          make_column("value", &SettingRecord::value)));
}

// Typedef for easier access within the Impl
using Storage = decltype(create_storage_impl(""));

struct DatabaseManager::Impl {
  Storage storage;
  std::mutex mtx; // one writer at a time keeps check-then-insert atomic
  Impl(const std::string &path) : storage(create_storage_impl(path)) {
    // Extended codes tell a unique-key clash apart from other constraints.
    storage.on_open = [](sqlite3 *db) {
      sqlite3_extended_result_codes(db, 1);
    };
  }
};

DatabaseManager::DatabaseManager(const std::string &dbPath,
                                 bool caseInsensitivePaths)
    : m_dbPath(dbPath), m_normalizer(caseInsensitivePaths),
      m_impl(std::make_unique<Impl>(dbPath)) {}

DatabaseManager::~DatabaseManager() = default;

CatalogStatus DatabaseManager::statusForSqliteCode(int code) {
  switch (code) {
  case SQLITE_CONSTRAINT_UNIQUE:
  case SQLITE_CONSTRAINT_PRIMARYKEY:
    return CatalogStatus::Duplicate;
  default:
    break;
  }
  switch (code & 0xff) {
  case SQLITE_CANTOPEN:
  case SQLITE_NOTADB:
  case SQLITE_IOERR:
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
  case SQLITE_CORRUPT:
    return CatalogStatus::Unavailable;
  default:
    return CatalogStatus::Failed;
  }
}

bool DatabaseManager::open() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    m_impl->storage.open_forever();
    m_impl->storage.pragma.user_version();
    std::cout << "[DB] Database connection verified: "
              << LogUtils::sanitizePath(m_dbPath) << std::endl;
    return true;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] Unable to open " << LogUtils::sanitizePath(m_dbPath)
              << ": " << e.what() << std::endl;
    return false;
  }
}

// open_forever() keeps one connection until the storage is destroyed.
void DatabaseManager::close() {}

void DatabaseManager::initializeSchema() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  std::cout << "[DB] Synchronizing schema via sqlite_orm..." << std::endl;
  m_impl->storage.sync_schema();
  std::cout << "[DB] Schema synchronized successfully." << std::endl;
}

std::string DatabaseManager::locationKeyFor(const CatalogEntry &entry) const {
  if (entry.storageType != StorageType::Local)
    return entry.locationKey;
  try {
    return m_normalizer.normalize(entry.locationKey);
  } catch (const InvalidPathError &) {
    return entry.locationKey; // stored as-is, surfaces later as an Error item
  }
}

// Clip operations
std::optional<std::vector<CatalogEntry>> DatabaseManager::listLocalEntries() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto clips = m_impl->storage.get_all<ClipRecord>(
        where(c(&ClipRecord::storageType) ==
              static_cast<int>(StorageType::Local)),
        order_by(&ClipRecord::id));
    auto tags = m_impl->storage.get_all<TagRecord>();
    auto links = m_impl->storage.get_all<ClipTagRecord>();

    std::map<int64_t, Tag> tagsById;
    for (const auto &t : tags)
      tagsById[t.id] = Tag{t.id, t.category, t.value};

    std::map<int64_t, std::vector<Tag>> tagsByClip;
    for (const auto &l : links) {
      auto it = tagsById.find(l.tagId);
      if (it != tagsById.end())
        tagsByClip[l.clipId].push_back(it->second);
    }

    std::vector<CatalogEntry> entries;
    entries.reserve(clips.size());
    for (const auto &clip : clips) {
      CatalogEntry entry = toEntry(clip);
      auto itTags = tagsByClip.find(clip.id);
      if (itTags != tagsByClip.end())
        entry.tags = itTags->second;
      entries.push_back(std::move(entry));
    }
    return entries;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] listLocalEntries Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

CreateResult DatabaseManager::createEntry(const std::string &locationKey,
                                          const std::string &title,
                                          int32_t durationSeconds) {
  CreateResult result;
  std::string key;
  try {
    key = m_normalizer.normalize(locationKey);
  } catch (const InvalidPathError &e) {
    result.status = CatalogStatus::Failed;
    result.message = e.what();
    return result;
  }

  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto existing = m_impl->storage.count<ClipRecord>(
        where(c(&ClipRecord::locationKey) == key));
    if (existing > 0) {
      result.status = CatalogStatus::Duplicate;
      result.message = "A clip with this file path already exists";
      return result;
    }

    ClipRecord record;
    record.title = title;
    record.storageType = static_cast<int>(StorageType::Local);
    record.locationString = m_normalizer.normalizePath(locationKey);
    record.locationKey = key;
    record.duration = durationSeconds;
    result.id = static_cast<int64_t>(m_impl->storage.insert(record));
    result.status = CatalogStatus::Ok;
  } catch (const std::system_error &e) {
    result.status = statusFor(e);
    result.message = result.status == CatalogStatus::Duplicate
                         ? "A clip with this file path already exists"
                         : e.what();
    std::cerr << "[DB] createEntry Error: " << e.what() << std::endl;
  }
  return result;
}

DeleteResult DatabaseManager::deleteEntry(int64_t id) {
  DeleteResult result;
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto clip = m_impl->storage.get_optional<ClipRecord>(id);
    if (!clip || clip->storageType != static_cast<int>(StorageType::Local)) {
      result.status = CatalogStatus::NotFound;
      result.message = "Clip with ID " + std::to_string(id) + " not found";
      return result;
    }

    m_impl->storage.transaction([&] {
      m_impl->storage.remove_all<ClipTagRecord>(
          where(c(&ClipTagRecord::clipId) == id));
      m_impl->storage.remove<ClipRecord>(id);
      return true;
    });
    result.status = CatalogStatus::Ok;
    result.removed = toEntry(*clip);
  } catch (const std::system_error &e) {
    result.status = statusFor(e);
    result.message = e.what();
    std::cerr << "[DB] deleteEntry Error: " << e.what() << std::endl;
  }
  return result;
}

bool DatabaseManager::updateThumbnail(int64_t id,
                                      const std::string &thumbnailPath) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto clip = m_impl->storage.get_optional<ClipRecord>(id);
    if (!clip)
      return false;
    clip->thumbnailPath = thumbnailPath;
    m_impl->storage.update(*clip);
    return true;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] updateThumbnail Error: " << e.what() << std::endl;
    return false;
  }
}

std::optional<CatalogEntry> DatabaseManager::getEntry(int64_t id) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto clip = m_impl->storage.get_optional<ClipRecord>(id);
    if (!clip)
      return std::nullopt;
    return toEntry(*clip);
  } catch (const std::system_error &e) {
    std::cerr << "[DB] getEntry Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::optional<std::vector<CatalogEntry>> DatabaseManager::getAllEntries() {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto clips = m_impl->storage.get_all<ClipRecord>(order_by(&ClipRecord::id));
    std::vector<CatalogEntry> entries;
    for (const auto &clip : clips)
      entries.push_back(toEntry(clip));
    return entries;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] getAllEntries Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

std::optional<int64_t> DatabaseManager::importEntry(const CatalogEntry &entry) {
  ClipRecord record;
  record.title = entry.title;
  record.description = entry.description;
  record.storageType = static_cast<int>(entry.storageType);
  record.locationString = entry.locationKey;
  record.locationKey = locationKeyFor(entry);
  record.duration = entry.durationSeconds;
  record.thumbnailPath = entry.thumbnailPath;

  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    return static_cast<int64_t>(m_impl->storage.insert(record));
  } catch (const std::system_error &e) {
    std::cerr << "[DB] importEntry Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

bool DatabaseManager::tagEntry(int64_t clipId, const std::string &category,
                               const std::string &value) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto existing = m_impl->storage.get_all<TagRecord>(
        where(c(&TagRecord::category) == category &&
              c(&TagRecord::value) == value));
    int64_t tagId = 0;
    if (existing.empty()) {
      TagRecord tag;
      tag.category = category;
      tag.value = value;
      tagId = static_cast<int64_t>(m_impl->storage.insert(tag));
    } else {
      tagId = existing.front().id;
    }
    m_impl->storage.replace(ClipTagRecord{clipId, tagId});
    return true;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] tagEntry Error: " << e.what() << std::endl;
    return false;
  }
}

// Settings
std::optional<std::string> DatabaseManager::getSetting(const std::string &key) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    auto setting = m_impl->storage.get_optional<SettingRecord>(key);
    if (!setting)
      return std::nullopt;
    return setting->value;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] getSetting Error: " << e.what() << std::endl;
    return std::nullopt;
  }
}

bool DatabaseManager::putSetting(const std::string &key,
                                 const std::string &value) {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  try {
    m_impl->storage.replace(SettingRecord{key, value});
    return true;
  } catch (const std::system_error &e) {
    std::cerr << "[DB] putSetting Error: " << e.what() << std::endl;
    return false;
  }
}

} // namespace clipsync
