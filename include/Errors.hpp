#pragma once

#include <stdexcept>
#include <string>

namespace clipsync {

// Root folder missing, relative or not a directory. Aborts a session before
// anything is scanned.
class RootNotFoundError : public std::runtime_error {
public:
  explicit RootNotFoundError(const std::string &message)
      : std::runtime_error(message) {}
};

// The catalog store cannot be reached. Fatal for the whole session.
class CatalogUnavailableError : public std::runtime_error {
public:
  explicit CatalogUnavailableError(const std::string &message)
      : std::runtime_error(message) {}
};

// Raised by PathNormalizer for syntactically invalid paths.
class InvalidPathError : public std::invalid_argument {
public:
  explicit InvalidPathError(const std::string &message)
      : std::invalid_argument(message) {}
};

} // namespace clipsync
