#include "PathNormalizer.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace clipsync {

PathNormalizer::PathNormalizer(bool caseInsensitive)
    : m_caseInsensitive(caseInsensitive) {}

std::string PathNormalizer::normalizePathSeparators(const std::string &path) {
  std::string result = path;
  std::replace(result.begin(), result.end(), '\\', '/');
  return result;
}

bool PathNormalizer::isAbsolute(const std::string &genericPath) {
  if (!genericPath.empty() && genericPath[0] == '/')
    return true;
  // Drive-letter paths ("C:/clips") stay absolute on every host.
  return genericPath.size() >= 3 &&
         std::isalpha(static_cast<unsigned char>(genericPath[0])) &&
         genericPath[1] == ':' && genericPath[2] == '/';
}

std::string PathNormalizer::normalizePath(const std::string &rawPath) const {
  if (rawPath.find('\0') != std::string::npos)
    throw InvalidPathError("Path contains a NUL character");

  auto first = std::find_if_not(rawPath.begin(), rawPath.end(), [](char c) {
    return std::isspace(static_cast<unsigned char>(c));
  });
  if (first == rawPath.end())
    throw InvalidPathError("Path is empty");

  std::string generic = normalizePathSeparators(rawPath);
  if (!isAbsolute(generic))
    throw InvalidPathError("Path must be absolute: " + rawPath);

  std::string result = fs::path(generic).lexically_normal().generic_string();

  // Keep "/" and "C:/" intact, strip every other trailing separator.
  std::size_t minLength = (result.size() >= 3 && result[1] == ':') ? 3 : 1;
  while (result.size() > minLength && result.back() == '/')
    result.pop_back();
  return result;
}

std::string PathNormalizer::keyFor(const std::string &normalizedPath) const {
  if (!m_caseInsensitive)
    return normalizedPath;
  std::string key = normalizedPath;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return key;
}

std::string PathNormalizer::normalize(const std::string &rawPath) const {
  return keyFor(normalizePath(rawPath));
}

bool PathNormalizer::isWithin(const std::string &key,
                              const std::string &rootKey) {
  if (rootKey.empty() || key.size() <= rootKey.size())
    return false;
  if (key.compare(0, rootKey.size(), rootKey) != 0)
    return false;
  return rootKey.back() == '/' || key[rootKey.size()] == '/';
}

} // namespace clipsync
