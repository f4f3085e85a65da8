#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace dustpan::model {

struct FileItem {
  std::string path;              // absolute, unique within a scan
  std::string name;              // display label (may carry a glyph and a project path)
  uint64_t size{};               // bytes; directories are summed eagerly
  bool is_dir{false};
  std::optional<int> age_days;   // only where recency matters (downloads)
};

struct ScanResult {
  std::string category;
  std::vector<FileItem> items;   // discovery order
  uint64_t total{};

  void add(FileItem item) {
    total += item.size;
    items.push_back(std::move(item));
  }

  void recompute_total() {
    total = 0;
    for (const auto& it : items) total += it.size;
  }
};

// Marked absolute paths of the current detail listing.
using SelectionSet = std::set<std::string, std::less<>>;

} // namespace dustpan::model
