#include "Errors.hpp"
#include "PathNormalizer.hpp"
#include "TestFakes.hpp"

using namespace clipsync;
using clipsync::test::check;

namespace {

bool rejects(const PathNormalizer &normalizer, const std::string &path) {
  try {
    normalizer.normalize(path);
    return false;
  } catch (const InvalidPathError &) {
    return true;
  }
}

} // namespace

int main() {
  std::cout << "[Test] Starting PathNormalizer Test..." << std::endl;

  PathNormalizer folding;
  PathNormalizer exact(false);

  check(folding.normalize("/Media/Clips/A.MP4") == "/media/clips/a.mp4",
        "case folded when case-insensitive");
  check(exact.normalize("/Media/Clips/A.MP4") == "/Media/Clips/A.MP4",
        "case kept when case-sensitive");
  check(folding.normalizePath("/Media/Clips/A.MP4") == "/Media/Clips/A.MP4",
        "display form keeps case");

  check(folding.normalize("C:\\Videos\\Clip.mp4") == "c:/videos/clip.mp4",
        "backslashes become forward slashes");
  check(folding.normalize("/media//clips/./a.mp4") == "/media/clips/a.mp4",
        "duplicate separators and dot segments collapse");
  check(folding.normalize("/media/clips/../other/a.mp4") ==
            "/media/other/a.mp4",
        "parent segments resolve lexically");
  check(folding.normalize("/media/clips/") == "/media/clips",
        "trailing separator stripped");
  check(folding.normalize("/") == "/", "filesystem root kept");
  check(folding.normalize("C:/") == "c:/", "drive root kept");

  check(folding.normalize("/a/b.mp4") == folding.normalize("/A//B.MP4"),
        "equivalent spellings give one key");

  check(rejects(folding, ""), "empty path rejected");
  check(rejects(folding, "   "), "blank path rejected");
  check(rejects(folding, "clips/a.mp4"), "relative path rejected");
  check(rejects(folding, std::string("/media/a\0b.mp4", 14)),
        "embedded NUL rejected");

  check(PathNormalizer::isWithin("/media/clips/a.mp4", "/media/clips"),
        "file below root is within");
  check(!PathNormalizer::isWithin("/media/clipsother/a.mp4", "/media/clips"),
        "sibling with shared prefix is not within");
  check(!PathNormalizer::isWithin("/media/clips", "/media/clips"),
        "root itself is not within");
  check(PathNormalizer::isWithin("/a.mp4", "/"), "anything is within /");

  return clipsync::test::finish("PathNormalizer Test");
}
