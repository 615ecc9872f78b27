#include "SyncApiServer.hpp"
#include "ApiJson.hpp"
#include "Errors.hpp"
#include "FileSystemScanner.hpp"
#include "LogUtils.hpp"
#include "ReconciliationSession.hpp"
#include "httplib.h"
#include <algorithm>
#include <cctype>
#include <iostream>

using json = nlohmann::json;

namespace clipsync {

namespace {

bool isBlank(const std::string &s) {
  return std::all_of(s.begin(), s.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
}

json parseBody(const std::string &body) {
  if (isBlank(body))
    return json::object();
  return json::parse(body);
}

ApiResponse errorResponse(int status, const std::string &message) {
  return ApiResponse{status, json{{"error", message}}};
}

} // namespace

struct SyncApiServer::Impl {
  httplib::Server server;
};

SyncApiServer::SyncApiServer(CatalogStore &catalog, MetadataProbe &probe,
                             ThumbnailGenerator &thumbnails,
                             ServerOptions options,
                             std::shared_ptr<CancellationFlag> shutdown)
    : m_impl(std::make_unique<Impl>()), m_catalog(catalog), m_probe(probe),
      m_thumbnails(thumbnails), m_options(std::move(options)),
      m_shutdown(shutdown ? std::move(shutdown)
                          : std::make_shared<CancellationFlag>()) {
  registerRoutes();
}

SyncApiServer::~SyncApiServer() { stop(); }

template <typename Fn>
ApiResponse SyncApiServer::guarded(const char *operation, Fn &&fn) {
  try {
    return fn();
  } catch (const RootNotFoundError &e) {
    std::cerr << "[Server] " << operation << ": " << e.what() << std::endl;
    return errorResponse(400, e.what());
  } catch (const CatalogUnavailableError &e) {
    std::cerr << "[Server] " << operation << ": " << e.what() << std::endl;
    return errorResponse(503, e.what());
  } catch (const json::exception &e) {
    std::cerr << "[Server] " << operation << ": bad request body: " << e.what()
              << std::endl;
    return errorResponse(400, std::string("Invalid request body: ") + e.what());
  } catch (const std::invalid_argument &e) {
    std::cerr << "[Server] " << operation << ": " << e.what() << std::endl;
    return errorResponse(400, e.what());
  } catch (const std::exception &e) {
    std::cerr << "[Server] " << operation << " failed: " << e.what()
              << std::endl;
    return errorResponse(500, e.what());
  }
}

std::string SyncApiServer::resolveRoot(const std::string &requestRoot) {
  if (!isBlank(requestRoot))
    return requestRoot;
  auto stored = m_catalog.getSetting(kRootFolderSetting);
  if (stored && !isBlank(*stored))
    return *stored;
  return m_options.configuredRootFolder;
}

ApiResponse SyncApiServer::handlePreview(const std::string &rootFolderPath) {
  return guarded("Preview", [&]() {
    std::cout << "[Server] Preview requested for "
              << LogUtils::sanitizePath(rootFolderPath) << std::endl;
    SessionOptions options;
    options.caseInsensitivePaths = m_options.caseInsensitivePaths;
    options.shutdown = m_shutdown;
    ReconciliationSession session(m_catalog, m_probe, m_thumbnails, options);
    PreviewReport report = session.preview(resolveRoot(rootFolderPath));
    return ApiResponse{200, ApiJson::toJson(report)};
  });
}

ApiResponse SyncApiServer::handleSelectiveSync(const std::string &body) {
  return guarded("Selective sync", [&]() {
    json request = parseBody(body);
    SyncSelection selection = ApiJson::parseSelection(request);
    std::string root = ApiJson::rootFolderOf(request);
    std::cout << "[Server] Selective sync: " << selection.filesToAdd.size()
              << " to add, " << selection.clipIdsToRemove.size()
              << " to remove, root " << LogUtils::sanitizePath(root)
              << std::endl;

    SessionOptions options;
    options.caseInsensitivePaths = m_options.caseInsensitivePaths;
    options.shutdown = m_shutdown;
    ReconciliationSession session(m_catalog, m_probe, m_thumbnails, options);
    SyncReport report = session.apply(resolveRoot(root), selection);
    return ApiResponse{200, ApiJson::toJson(report)};
  });
}

ApiResponse SyncApiServer::handleFullSync(const std::string &body) {
  return guarded("Sync", [&]() {
    json request = parseBody(body);
    std::string root = ApiJson::rootFolderOf(request);
    std::cout << "[Server] Full sync requested for "
              << LogUtils::sanitizePath(root) << std::endl;

    SessionOptions options;
    options.caseInsensitivePaths = m_options.caseInsensitivePaths;
    options.shutdown = m_shutdown;
    ReconciliationSession session(m_catalog, m_probe, m_thumbnails, options);
    SyncReport report = session.fullSync(resolveRoot(root));
    return ApiResponse{200, ApiJson::toJson(report)};
  });
}

ApiResponse SyncApiServer::handleGetRootFolder() {
  return guarded("Get root folder", [&]() {
    json j;
    auto stored = m_catalog.getSetting(kRootFolderSetting);
    if (stored && !isBlank(*stored)) {
      j["rootFolderPath"] = *stored;
      j["source"] = "setting";
    } else if (!isBlank(m_options.configuredRootFolder)) {
      j["rootFolderPath"] = m_options.configuredRootFolder;
      j["source"] = "config";
    } else {
      j["rootFolderPath"] = nullptr;
      j["source"] = "none";
    }
    return ApiResponse{200, j};
  });
}

ApiResponse SyncApiServer::handlePutRootFolder(const std::string &body) {
  return guarded("Put root folder", [&]() {
    json request = parseBody(body);
    FileSystemScanner scanner(PathNormalizer(m_options.caseInsensitivePaths));
    // Throws RootNotFoundError for blank, relative or missing folders.
    std::string root = scanner.validateRoot(ApiJson::rootFolderOf(request));

    if (!m_catalog.putSetting(kRootFolderSetting, root))
      throw CatalogUnavailableError("Could not store the root folder setting");

    std::cout << "[Server] Root folder set to " << LogUtils::sanitizePath(root)
              << std::endl;
    return ApiResponse{200, json{{"rootFolderPath", root}}};
  });
}

void SyncApiServer::registerRoutes() {
  auto &svr = m_impl->server;
  auto send = [](httplib::Response &res, const ApiResponse &response) {
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
  };

  svr.Get("/api/clips/sync-preview",
          [this, send](const httplib::Request &req, httplib::Response &res) {
            std::string root;
            if (req.has_param("rootFolderPath"))
              root = req.get_param_value("rootFolderPath");
            send(res, handlePreview(root));
          });

  svr.Post("/api/clips/selective-sync",
           [this, send](const httplib::Request &req, httplib::Response &res) {
             send(res, handleSelectiveSync(req.body));
           });

  svr.Post("/api/clips/sync",
           [this, send](const httplib::Request &req, httplib::Response &res) {
             send(res, handleFullSync(req.body));
           });

  svr.Get("/api/settings/root-folder",
          [this, send](const httplib::Request &, httplib::Response &res) {
            send(res, handleGetRootFolder());
          });

  svr.Put("/api/settings/root-folder",
          [this, send](const httplib::Request &req, httplib::Response &res) {
            send(res, handlePutRootFolder(req.body));
          });
}

bool SyncApiServer::listen() {
  std::cout << "[Server] Listening on " << m_options.host << ":"
            << m_options.port << std::endl;
  bool ok = m_impl->server.listen(m_options.host, m_options.port);
  if (!ok && !m_shutdown->isCancelled()) {
    std::cerr << "[Server] Could not listen on " << m_options.host << ":"
              << m_options.port << std::endl;
  }
  return ok || m_shutdown->isCancelled();
}

void SyncApiServer::stop() {
  if (m_impl && m_impl->server.is_running()) {
    m_shutdown->cancel();
    m_impl->server.stop();
    std::cout << "[Server] Stopped" << std::endl;
  }
}

} // namespace clipsync
