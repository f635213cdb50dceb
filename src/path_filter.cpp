#include "path_filter.hpp"

#include <algorithm>

namespace {

std::string forward_slashes(std::string value) {
  std::replace(value.begin(), value.end(), '\\', '/');
  return value;
}

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<std::string> default_watch_folders() {
  return {"mods", "config", "resourcepacks", "shaderpacks"};
}

std::vector<std::string> default_ignore_patterns() {
  return {"*.log", "*.tmp", "crash-reports/*", "logs/*", ".cache/*"};
}

bool matches_glob(const std::string& relative_path, const std::string& pattern) {
  auto path = forward_slashes(relative_path);
  auto glob = forward_slashes(pattern);
  if(glob.empty()) return false;

  if(glob.size() >= 2 && ends_with(glob, "/*")) {
    auto dir = glob.substr(0, glob.size() - 2);
    return path == dir || path.compare(0, dir.size() + 1, dir + "/") == 0;
  }
  if(glob.rfind("*.", 0) == 0) {
    return ends_with(path, glob.substr(1));
  }
  return path == glob;
}

bool matches_ignore_pattern(const std::string& relative_path, const std::vector<std::string>& patterns) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&](const std::string& pattern){ return matches_glob(relative_path, pattern); });
}
