#include "LibraryWatcher.hpp"
#include "FileSystemScanner.hpp"
#include "LogUtils.hpp"
#include <atomic>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace clipsync {

namespace {

enum class SettleState { Polling, Settling, Ready };

struct PendingEvent {
  fs::file_time_type lastMTime;
  std::chrono::steady_clock::time_point nextCheck;
  SettleState state;
};

std::string joinPath(const std::string &dir, const std::string &filename) {
  std::string fullPath = dir + filename;
  if (!dir.empty() && dir.back() != '/' && dir.back() != '\\')
    fullPath = dir + "/" + filename;
  return fs::path(fullPath).lexically_normal().generic_string();
}

// Deleted directories have no extension; they may have held videos.
bool mayHoldVideo(const std::string &path) {
  fs::path p(path);
  return FileSystemScanner::isVideoFile(p) || !p.has_extension();
}

} // namespace

struct LibraryWatcher::Impl : public efsw::FileWatchListener {
  efsw::FileWatcher watcher;
  efsw::WatchID watchId = 0;
  bool running = false;

  std::map<std::string, PendingEvent> pendingEvents;
  mutable std::mutex mtx;
  std::thread workerThread;
  std::atomic<bool> workerRunning{false};
  LibraryWatcher::Callback callback;

  std::chrono::milliseconds pollInterval{100};
  std::chrono::milliseconds settleTime{2000};

  void workerLoop() {
    while (workerRunning) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));

      std::vector<std::string> batch;
      {
        std::lock_guard<std::mutex> lock(mtx);
        if (pendingEvents.empty())
          continue;
        auto now = std::chrono::steady_clock::now();
        bool allReady = true;

        for (auto &[path, pending] : pendingEvents) {
          if (pending.state == SettleState::Ready)
            continue;
          if (now < pending.nextCheck) {
            allReady = false;
            continue;
          }

          std::error_code ec;
          if (!fs::exists(path, ec)) {
            // Gone while settling: the sync will see it as missing.
            pending.state = SettleState::Ready;
            continue;
          }
          auto currentMTime = fs::last_write_time(path, ec);
          if (ec) {
            pending.nextCheck = now + pollInterval;
            allReady = false;
            continue;
          }

          if (currentMTime != pending.lastMTime) {
            // Still being written
            pending.lastMTime = currentMTime;
            pending.nextCheck = now + pollInterval;
            pending.state = SettleState::Polling;
            allReady = false;
          } else if (pending.state == SettleState::Polling) {
            pending.state = SettleState::Settling;
            pending.nextCheck = now + settleTime;
            allReady = false;
          } else {
            pending.state = SettleState::Ready;
          }
        }

        if (!allReady)
          continue;
        for (const auto &entry : pendingEvents)
          batch.push_back(entry.first);
        pendingEvents.clear();
      }

      if (callback) {
        try {
          callback(batch);
        } catch (const std::exception &e) {
          std::cerr << "[Watcher] Sync after change failed: " << e.what()
                    << std::endl;
        }
      }
    }
  }

  void pushEvent(const std::string &path, bool removed) {
    std::lock_guard<std::mutex> lock(mtx);
    auto now = std::chrono::steady_clock::now();
    if (removed) {
      pendingEvents[path] =
          PendingEvent{(fs::file_time_type::min)(), now, SettleState::Ready};
      return;
    }

    std::error_code ec;
    fs::file_time_type mtime = fs::last_write_time(path, ec);
    if (ec)
      mtime = (fs::file_time_type::min)();
    pendingEvents[path] =
        PendingEvent{mtime, now + pollInterval, SettleState::Polling};
  }

  void handleFileAction(efsw::WatchID, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename) override {
    std::string fullPath = joinPath(dir, filename);
    switch (action) {
    case efsw::Actions::Add:
    case efsw::Actions::Modified:
      if (FileSystemScanner::isVideoFile(fullPath))
        pushEvent(fullPath, false);
      break;
    case efsw::Actions::Delete:
      if (mayHoldVideo(fullPath))
        pushEvent(fullPath, true);
      break;
    case efsw::Actions::Moved:
      if (!oldFilename.empty()) {
        std::string fullOldPath = joinPath(dir, oldFilename);
        if (mayHoldVideo(fullOldPath))
          pushEvent(fullOldPath, true);
      }
      if (FileSystemScanner::isVideoFile(fullPath))
        pushEvent(fullPath, false);
      break;
    default:
      break;
    }
  }
};

LibraryWatcher::LibraryWatcher(const std::string &rootFolder, Callback callback,
                               std::chrono::milliseconds settleTime)
    : m_impl(std::make_unique<Impl>()), m_rootFolder(rootFolder) {
  m_impl->callback = std::move(callback);
  m_impl->settleTime = settleTime;
}

LibraryWatcher::~LibraryWatcher() { stop(); }

void LibraryWatcher::notifyChanged(const std::string &path) {
  m_impl->pushEvent(path, false);
}

void LibraryWatcher::notifyRemoved(const std::string &path) {
  m_impl->pushEvent(path, true);
}

std::size_t LibraryWatcher::pendingCount() const {
  std::lock_guard<std::mutex> lock(m_impl->mtx);
  return m_impl->pendingEvents.size();
}

bool LibraryWatcher::start() {
  if (m_impl->running)
    return true;

  m_impl->watchId = m_impl->watcher.addWatch(m_rootFolder, m_impl.get(), true);
  if (m_impl->watchId < 0) {
    std::cerr << "[Watcher] Error starting watcher: "
              << efsw::Errors::Log::getLastErrorLog() << std::endl;
    return false;
  }

  m_impl->workerRunning = true;
  m_impl->workerThread = std::thread(&Impl::workerLoop, m_impl.get());
  m_impl->watcher.watch();
  m_impl->running = true;
  std::cout << "[Watcher] Started monitoring (with debouncing): "
            << LogUtils::sanitizePath(m_rootFolder) << std::endl;
  return true;
}

void LibraryWatcher::stop() {
  if (!m_impl->running)
    return;

  m_impl->watcher.removeWatch(m_impl->watchId);

  m_impl->workerRunning = false;
  if (m_impl->workerThread.joinable()) {
    m_impl->workerThread.join();
  }

  m_impl->running = false;
  std::cout << "[Watcher] Stopped monitoring: "
            << LogUtils::sanitizePath(m_rootFolder) << std::endl;
}

} // namespace clipsync
