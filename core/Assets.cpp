#include "core/Assets.hpp"
#include <filesystem>
#include <string>

namespace assets {

namespace fs = std::filesystem;

namespace {

fs::path FindAssetsDir() {
  // Search for the 'assets' directory in the current directory and its parents.
  fs::path current = fs::current_path();
  for (int i = 0; i < 4; ++i) {
    if (fs::exists(current / "assets")) {
      return current / "assets";
    }
    if (!current.has_parent_path() || current.parent_path() == current) {
      break;
    }
    current = current.parent_path();
  }
  return fs::path("assets");
}

} // namespace

const char *Path(const char *relative) {
  static thread_local std::string s_PathBuf;
  s_PathBuf = (FindAssetsDir() / relative).string();
  return s_PathBuf.c_str();
}

std::string SectionPath(const std::string &name) {
  return (FindAssetsDir() / "sections" / (name + ".json")).string();
}

bool Exists(const char *relative) {
  return fs::exists(FindAssetsDir() / relative);
}

} // namespace assets
