#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

/**
 * LibraryWatcher monitors a root folder for changes to video files.
 *
 * Events are debounced: a changed file is reported only after its mtime has
 * been stable for the settle time, a deleted or moved-away file right away.
 * Paths that settle together are delivered as one batch, on the watcher's
 * worker thread, so batches never overlap.
 */
class LibraryWatcher {
public:
  using Callback = std::function<void(const std::vector<std::string> &paths)>;

  LibraryWatcher(const std::string &rootFolder, Callback callback,
                 std::chrono::milliseconds settleTime = std::chrono::milliseconds(2000));
  ~LibraryWatcher();

  bool start();
  void stop();

  // Entry point for file events; also used by tests to feed events directly.
  void notifyChanged(const std::string &path);
  void notifyRemoved(const std::string &path);

  // Number of paths waiting to settle.
  std::size_t pendingCount() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
  std::string m_rootFolder;
};

} // namespace clipsync
