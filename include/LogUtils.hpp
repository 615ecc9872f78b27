#pragma once

#include <cstddef>
#include <string>

namespace clipsync {

/**
 * Helpers for putting user-supplied strings (paths, request fields) into log
 * lines without letting them forge extra lines.
 */
class LogUtils {
public:
  static constexpr std::size_t kDefaultMaxLength = 500;

  // Control characters become spaces, whitespace runs collapse, result is
  // trimmed and truncated to maxLength with a "..." suffix.
  static std::string sanitize(const std::string &input,
                              std::size_t maxLength = kDefaultMaxLength);

  static std::string sanitizePath(const std::string &path,
                                  std::size_t maxLength = kDefaultMaxLength);
};

} // namespace clipsync
