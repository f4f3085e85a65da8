#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include "model/FileItem.hpp"

namespace dustpan::model {

// One complete scan run: non-empty categories keyed (and ordered) by name.
struct Snapshot {
  std::map<std::string, ScanResult, std::less<>> categories;
  uint64_t grand_total{};

  [[nodiscard]] const ScanResult* find(std::string_view category) const {
    auto it = categories.find(category);
    return it == categories.end() ? nullptr : &it->second;
  }

  [[nodiscard]] ScanResult* find(std::string_view category) {
    auto it = categories.find(category);
    return it == categories.end() ? nullptr : &it->second;
  }

  [[nodiscard]] size_t item_count() const {
    size_t n = 0;
    for (const auto& [name, r] : categories) n += r.items.size();
    return n;
  }

  [[nodiscard]] bool empty() const { return categories.empty(); }

  // Re-derive every category total and the grand total from the items.
  void recompute() {
    grand_total = 0;
    for (auto& [name, r] : categories) {
      r.recompute_total();
      grand_total += r.total;
    }
  }
};

} // namespace dustpan::model
