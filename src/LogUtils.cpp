#include "LogUtils.hpp"
#include <cctype>

namespace clipsync {

std::string LogUtils::sanitize(const std::string &input,
                               std::size_t maxLength) {
  if (input.empty() || maxLength == 0)
    return "";

  std::string truncated = input;
  if (truncated.size() > maxLength)
    truncated = truncated.substr(0, maxLength) + "...";

  std::string result;
  result.reserve(truncated.size());
  bool lastWasSpace = false;
  for (char ch : truncated) {
    unsigned char c = static_cast<unsigned char>(ch);
    bool space = c < 0x20 || c == 0x7f || std::isspace(c);
    if (space) {
      if (!lastWasSpace && !result.empty())
        result.push_back(' ');
      lastWasSpace = true;
      continue;
    }
    result.push_back(ch);
    lastWasSpace = false;
  }
  if (!result.empty() && result.back() == ' ')
    result.pop_back();
  return result;
}

std::string LogUtils::sanitizePath(const std::string &path,
                                   std::size_t maxLength) {
  return sanitize(path, maxLength);
}

} // namespace clipsync
