#include "ApiJson.hpp"
#include "ConfigLoader.hpp"
#include "DatabaseManager.hpp"
#include "Errors.hpp"
#include "LibraryWatcher.hpp"
#include "LogUtils.hpp"
#include "MetadataProbe.hpp"
#include "ReconciliationSession.hpp"
#include "SyncApiServer.hpp"
#include "ThumbnailGenerator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

std::atomic<bool> running{true};
std::mutex cv_m;
std::condition_variable cv;
std::shared_ptr<clipsync::CancellationFlag> shutdownFlag =
    std::make_shared<clipsync::CancellationFlag>();
clipsync::SyncApiServer *activeServer = nullptr;

void signalHandler(int sig) {
  std::cout << "[Main] Shutdown signal received (" << sig << ")" << std::endl;
  running.store(false);
  shutdownFlag->cancel();
  cv.notify_all();
  if (activeServer)
    activeServer->stop();
}

void printUsage() {
  std::cerr
      << "Usage: clipsync [--config FILE] <command> [args]\n"
         "  preview [ROOT]                       scan and diff, change nothing\n"
         "  apply [--root ROOT] [--add PATH]... [--remove ID]...\n"
         "                                       apply a chosen selection\n"
         "  sync [ROOT]                          add all new, remove all missing\n"
         "  serve                                run the HTTP API\n"
         "  watch [ROOT]                         sync whenever videos change\n";
}

struct CommandLine {
  std::string configPath = "clipsync.json";
  std::string command;
  std::string root;
  clipsync::SyncSelection selection;
};

// Returns false on malformed arguments.
bool parseArgs(int argc, char **argv, CommandLine &cmd) {
  std::vector<std::string> args(argv + 1, argv + argc);
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    bool hasValue = i + 1 < args.size();
    if (arg == "--config" && hasValue) {
      cmd.configPath = args[++i];
    } else if (arg == "--root" && hasValue) {
      cmd.root = args[++i];
    } else if (arg == "--add" && hasValue) {
      cmd.selection.filesToAdd.push_back(args[++i]);
    } else if (arg == "--remove" && hasValue) {
      try {
        cmd.selection.clipIdsToRemove.push_back(std::stoll(args[++i]));
      } catch (const std::exception &) {
        std::cerr << "[Main] Invalid clip id: "
                  << clipsync::LogUtils::sanitize(args[i]) << std::endl;
        return false;
      }
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "[Main] Unknown option: " << clipsync::LogUtils::sanitize(arg)
                << std::endl;
      return false;
    } else if (cmd.command.empty()) {
      cmd.command = arg;
    } else if (cmd.root.empty()) {
      cmd.root = arg;
    } else {
      return false;
    }
  }
  return !cmd.command.empty();
}

std::string storedOrConfiguredRoot(clipsync::DatabaseManager &db,
                                   const clipsync::AppConfig &config) {
  auto stored = db.getSetting(clipsync::SyncApiServer::kRootFolderSetting);
  if (stored && !stored->empty())
    return *stored;
  return config.defaultRootFolder;
}

int runWatch(clipsync::ReconciliationSession &session, const std::string &root,
             const clipsync::AppConfig &config) {
  // Bring the catalog up to date before listening for changes.
  clipsync::SyncReport initial = session.fullSync(root);
  std::cout << clipsync::ApiJson::toJson(initial).dump(2) << std::endl;
  const std::string watchedRoot = initial.rootFolderPath;

  clipsync::LibraryWatcher watcher(
      watchedRoot,
      [&session, &watchedRoot](const std::vector<std::string> &paths) {
        std::cout << "[Watcher] " << paths.size()
                  << " video path(s) changed, syncing" << std::endl;
        clipsync::SyncReport report = session.fullSync(watchedRoot);
        std::cout << "[Watcher] Added " << report.totalAdded << ", removed "
                  << report.totalRemoved << ", failed " << report.errors.size()
                  << std::endl;
      },
      std::chrono::milliseconds(config.watchSettleMs));
  if (!watcher.start())
    return 1;

  std::unique_lock<std::mutex> lock(cv_m);
  cv.wait(lock, [] { return !running.load(); });
  watcher.stop();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  CommandLine cmd;
  if (!parseArgs(argc, argv, cmd)) {
    printUsage();
    return 2;
  }

  clipsync::AppConfig config = clipsync::ConfigLoader::load(cmd.configPath);

  try {
    clipsync::DatabaseManager dbManager(config.databasePath,
                                        config.caseInsensitivePaths);
    if (!dbManager.open()) {
      std::cerr << "[Main] Failed to open database." << std::endl;
      return 1;
    }
    dbManager.initializeSchema();
    std::cout << "[Main] Database initialized." << std::endl;

    clipsync::FfprobeMetadataProbe probe(config.ffmpegBinaryFolder);
    clipsync::FfmpegThumbnailGenerator thumbnails(
        config.thumbnailsDirectory, config.thumbnailWidth,
        config.thumbnailHeight, config.ffmpegBinaryFolder);

    if (cmd.command == "serve") {
      clipsync::ServerOptions options;
      options.host = config.serverHost;
      options.port = config.serverPort;
      options.configuredRootFolder = config.defaultRootFolder;
      options.caseInsensitivePaths = config.caseInsensitivePaths;
      clipsync::SyncApiServer server(dbManager, probe, thumbnails, options,
                                     shutdownFlag);
      activeServer = &server;
      bool ok = server.listen();
      activeServer = nullptr;
      dbManager.close();
      std::cout << "[Main] Finished." << std::endl;
      return ok ? 0 : 1;
    }

    clipsync::SessionOptions options;
    options.defaultRootFolder = storedOrConfiguredRoot(dbManager, config);
    options.caseInsensitivePaths = config.caseInsensitivePaths;
    options.shutdown = shutdownFlag;
    clipsync::ReconciliationSession session(dbManager, probe, thumbnails,
                                            options);

    int rc = 0;
    if (cmd.command == "preview") {
      clipsync::PreviewReport report = session.preview(cmd.root);
      std::cout << clipsync::ApiJson::toJson(report).dump(2) << std::endl;
    } else if (cmd.command == "apply") {
      clipsync::SyncReport report = session.apply(cmd.root, cmd.selection);
      std::cout << clipsync::ApiJson::toJson(report).dump(2) << std::endl;
      rc = report.errors.empty() ? 0 : 3;
    } else if (cmd.command == "sync") {
      clipsync::SyncReport report = session.fullSync(cmd.root);
      std::cout << clipsync::ApiJson::toJson(report).dump(2) << std::endl;
      rc = report.errors.empty() ? 0 : 3;
    } else if (cmd.command == "watch") {
      rc = runWatch(session, cmd.root, config);
    } else {
      std::cerr << "[Main] Unknown command: "
                << clipsync::LogUtils::sanitize(cmd.command) << std::endl;
      printUsage();
      rc = 2;
    }

    dbManager.close();
    std::cout << "[Main] Finished." << std::endl;
    return rc;
  } catch (const clipsync::RootNotFoundError &e) {
    std::cerr << "[Main] Root folder error: " << e.what() << std::endl;
    return 1;
  } catch (const clipsync::CatalogUnavailableError &e) {
    std::cerr << "[Main] Catalog unavailable: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "[Main] Error: " << e.what() << std::endl;
    return 1;
  }
}
