#pragma once

#include "CancellationFlag.hpp"
#include "CatalogStore.hpp"
#include "MetadataProbe.hpp"
#include "ThumbnailGenerator.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace clipsync {

struct ApiResponse {
  int status = 200;
  nlohmann::json body;
};

struct ServerOptions {
  std::string host = "127.0.0.1";
  int port = 5000;
  std::string configuredRootFolder; // fallback after the stored setting
  bool caseInsensitivePaths = true;
};

/**
 * SyncApiServer exposes preview/apply over HTTP.
 * Uses cpp-httplib for networking and nlohmann/json for serialization.
 *
 * Every request gets its own ReconciliationSession; the catalog and the
 * collaborators are shared and must be safe to call from httplib's worker
 * threads. The handle* methods carry the request logic and can be driven
 * without a socket.
 */
class SyncApiServer {
public:
  static constexpr const char *kRootFolderSetting = "VideoLibrary.RootFolder";

  SyncApiServer(CatalogStore &catalog, MetadataProbe &probe,
                ThumbnailGenerator &thumbnails, ServerOptions options,
                std::shared_ptr<CancellationFlag> shutdown = nullptr);
  ~SyncApiServer();

  // Blocks until stop() is called. Returns false if the port cannot be bound.
  bool listen();
  void stop();

  // GET /api/clips/sync-preview?rootFolderPath=
  ApiResponse handlePreview(const std::string &rootFolderPath);
  // POST /api/clips/selective-sync
  ApiResponse handleSelectiveSync(const std::string &body);
  // POST /api/clips/sync
  ApiResponse handleFullSync(const std::string &body);
  // GET /api/settings/root-folder
  ApiResponse handleGetRootFolder();
  // PUT /api/settings/root-folder
  ApiResponse handlePutRootFolder(const std::string &body);

  // Request root if not blank, else stored setting, else configured default.
  std::string resolveRoot(const std::string &requestRoot);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  CatalogStore &m_catalog;
  MetadataProbe &m_probe;
  ThumbnailGenerator &m_thumbnails;
  ServerOptions m_options;
  std::shared_ptr<CancellationFlag> m_shutdown;

  template <typename Fn> ApiResponse guarded(const char *operation, Fn &&fn);
  void registerRoutes();
};

} // namespace clipsync
