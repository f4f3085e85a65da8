// Best-effort filesystem measurement helpers (lstat/readdir based)
#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include "model/FileItem.hpp"

namespace dustpan::util {

struct EntryInfo {
  std::string name;
  std::string path;
  bool is_dir{false};      // real directory, symlinks are never followed
  uint64_t size{};         // lstat size (not the subtree sum for directories)
  std::time_t mtime{};
};

// True if something exists at path (a dangling symlink counts).
[[nodiscard]] bool path_exists(const std::string& path);

// Join a directory and an entry name with exactly one separator.
[[nodiscard]] std::string join_path(const std::string& dir, const std::string& name);

// Sum of the sizes of every non-directory entry below path. Unreadable
// directories and vanished entries contribute zero; a regular file yields its
// own size; a missing path yields 0. A stop request returns the partial sum.
[[nodiscard]] uint64_t directory_size(const std::string& path, std::stop_token st = {});

// One level of entries under dir, unsorted. nullopt if dir cannot be opened.
[[nodiscard]] std::optional<std::vector<EntryInfo>> read_entries(const std::string& dir);

// Immediate children of dir as FileItems, sized (recursively for
// subdirectories) and sorted by size descending, ties by name. A stop request
// ends the listing early with the entries sized so far.
[[nodiscard]] std::optional<std::vector<dustpan::model::FileItem>> list_directory(const std::string& dir,
                                                                                std::stop_token st = {});

} // namespace dustpan::util
