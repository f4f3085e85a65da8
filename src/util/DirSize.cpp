#include "util/DirSize.hpp"

#include <sys/types.h>
#include <sys/stat.h>
#include <dirent.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>

namespace dustpan::util {

bool path_exists(const std::string& path) {
  struct stat st{};
  return ::lstat(path.c_str(), &st) == 0;
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

uint64_t directory_size(const std::string& path, std::stop_token st) {
  struct stat root{};
  if (::lstat(path.c_str(), &root) != 0) return 0;
  if (!S_ISDIR(root.st_mode)) return root.st_size > 0 ? static_cast<uint64_t>(root.st_size) : 0;

  uint64_t total = 0;
  std::vector<std::string> pending{path};
  while (!pending.empty()) {
    if (st.stop_requested()) break;
    std::string dir = std::move(pending.back());
    pending.pop_back();
    DIR* d = ::opendir(dir.c_str());
    if (!d) continue; // permission denied or vanished
    while (auto* ent = ::readdir(d)) {
      const char* name = ent->d_name;
      if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
      std::string child = join_path(dir, name);
      if (ent->d_type == DT_DIR) {
        pending.push_back(std::move(child));
        continue;
      }
      struct stat cs{};
      if (::lstat(child.c_str(), &cs) != 0) continue;
      if (S_ISDIR(cs.st_mode)) {
        pending.push_back(std::move(child));
      } else if (cs.st_size > 0) {
        total += static_cast<uint64_t>(cs.st_size);
      }
    }
    ::closedir(d);
  }
  return total;
}

std::optional<std::vector<EntryInfo>> read_entries(const std::string& dir) {
  DIR* d = ::opendir(dir.c_str());
  if (!d) return std::nullopt;
  std::vector<EntryInfo> out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    EntryInfo e;
    e.name = name;
    e.path = join_path(dir, e.name);
    struct stat st{};
    if (::lstat(e.path.c_str(), &st) != 0) continue;
    e.is_dir = S_ISDIR(st.st_mode);
    e.size = st.st_size > 0 ? static_cast<uint64_t>(st.st_size) : 0;
    e.mtime = st.st_mtime;
    out.push_back(std::move(e));
  }
  ::closedir(d);
  return out;
}

std::optional<std::vector<dustpan::model::FileItem>> list_directory(const std::string& dir, std::stop_token st) {
  auto entries = read_entries(dir);
  if (!entries) return std::nullopt;
  std::vector<dustpan::model::FileItem> items;
  items.reserve(entries->size());
  for (auto& e : *entries) {
    if (st.stop_requested()) break;
    dustpan::model::FileItem it;
    it.size = e.is_dir ? directory_size(e.path, st) : e.size;
    it.path = std::move(e.path);
    it.name = std::move(e.name);
    it.is_dir = e.is_dir;
    items.push_back(std::move(it));
  }
  std::sort(items.begin(), items.end(), [](const auto& a, const auto& b){
    if (a.size != b.size) return a.size > b.size;
    return a.name < b.name;
  });
  return items;
}

} // namespace dustpan::util
