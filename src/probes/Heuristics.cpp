#include "probes/Heuristics.hpp"
#include "util/DirSize.hpp"
#include <string_view>

namespace dustpan::probes {

namespace {

constexpr const char* kSkipFragments[] = {
  "/Library/", "/System/", "/.Trash/", "/Applications/",
  "/usr/", "/bin/", "/sbin/",
  "/.local/share/Trash/", "/proc/", "/sys/", "/dev/", "/.git/",
};

constexpr const char* kProjectMarkers[] = {
  "package.json", "Cargo.toml", "pom.xml", "build.gradle", "Makefile", "CMakeLists.txt",
};

} // namespace

bool should_skip_dir(const std::string& path, const std::vector<std::string>& extra_skip) {
  // Match fragments against the directory itself, not only its children
  std::string p = path;
  if (p.empty() || p.back() != '/') p += '/';
  const bool user_area = p.find("/Documents/") != std::string::npos ||
                         p.find("/Desktop/") != std::string::npos;
  for (const char* frag : kSkipFragments) {
    if (p.find(frag) == std::string::npos) continue;
    if (user_area && std::string_view(frag) == "/Library/") continue;
    return true;
  }
  for (const auto& frag : extra_skip) {
    if (!frag.empty() && p.find(frag) != std::string::npos) return true;
  }
  return false;
}

bool is_project_dir(const std::string& dir) {
  for (const char* marker : kProjectMarkers) {
    if (dustpan::util::path_exists(dustpan::util::join_path(dir, marker))) return true;
  }
  return false;
}

std::string relative_label(const std::string& root, const std::string& dir) {
  if (dir == root) return "~";
  if (!root.empty() && dir.size() > root.size() && dir.starts_with(root) &&
      (root.back() == '/' || dir[root.size()] == '/')) {
    std::string rel = dir.substr(root.size());
    while (!rel.empty() && rel.front() == '/') rel.erase(rel.begin());
    return rel;
  }
  return dir;
}

} // namespace dustpan::probes
