#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace clipsync {

/**
 * Cooperative cancellation checked between items only.
 *
 * A flag built with a parent also reads as cancelled once the parent is.
 * reset() clears the flag's own state and never touches the parent, so a
 * session can clear its per-run cancel while a process shutdown stays set.
 */
class CancellationFlag {
public:
  CancellationFlag() = default;
  explicit CancellationFlag(std::shared_ptr<const CancellationFlag> parent)
      : m_parent(std::move(parent)) {}

  void cancel() { m_cancelled.store(true); }
  void reset() { m_cancelled.store(false); }
  bool isCancelled() const {
    return m_cancelled.load() || (m_parent && m_parent->isCancelled());
  }

private:
  std::atomic<bool> m_cancelled{false};
  std::shared_ptr<const CancellationFlag> m_parent;
};

} // namespace clipsync
