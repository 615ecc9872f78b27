#ifndef PATHNORMALIZER_HPP
#define PATHNORMALIZER_HPP

#include <string>

namespace clipsync {

/**
 * PathNormalizer turns raw path strings (from a scan or from stored catalog
 * locations) into one comparison key per physical file.
 */
class PathNormalizer {
public:
  explicit PathNormalizer(bool caseInsensitive = true);

  // Separator-normalized, lexically normal absolute path with the original
  // case kept. Throws InvalidPathError.
  std::string normalizePath(const std::string &rawPath) const;

  // Comparison key: normalizePath() plus case folding when enabled.
  std::string normalize(const std::string &rawPath) const;

  // Folds an already normalized path into a key.
  std::string keyFor(const std::string &normalizedPath) const;

  bool caseInsensitive() const { return m_caseInsensitive; }

  // True if key lies strictly below rootKey.
  static bool isWithin(const std::string &key, const std::string &rootKey);

private:
  bool m_caseInsensitive;

  static bool isAbsolute(const std::string &genericPath);
  static std::string normalizePathSeparators(const std::string &path);
};

} // namespace clipsync

#endif // PATHNORMALIZER_HPP
