#include "probes/DirectoryProbe.hpp"
#include "probes/Heuristics.hpp"
#include "util/DirSize.hpp"

#include <algorithm>
#include <ctime>

namespace dustpan::probes {

using dustpan::model::FileItem;
using dustpan::model::ScanResult;

namespace {

constexpr std::time_t kSecondsPerDay = 86400;
// Walk notices are sampled; found items are always offered
constexpr unsigned kWalkNoticeEvery = 64;

} // namespace

DirectoryProbe::DirectoryProbe(std::string category, std::vector<Location> locations,
                               std::optional<TreeMatch> tree)
    : category_(std::move(category)), locations_(std::move(locations)), tree_(std::move(tree)) {}

ScanResult DirectoryProbe::scan(std::stop_token st, dustpan::app::ProgressQueue* progress) const {
  ScanResult out;
  out.category = category_;
  for (const auto& loc : locations_) {
    if (st.stop_requested()) break;
    scan_location(loc, out, st, progress);
  }
  if (tree_ && !st.stop_requested()) walk_tree(*tree_, out, st, progress);
  return out;
}

void DirectoryProbe::scan_location(const Location& loc, ScanResult& out,
                                   std::stop_token st, dustpan::app::ProgressQueue* progress) const {
  if (!dustpan::util::path_exists(loc.path)) return;

  if (loc.collect == Collect::Whole) {
    uint64_t size = dustpan::util::directory_size(loc.path, st);
    if (size < loc.min_bytes) return;
    found(out, FileItem{.path = loc.path, .name = loc.label, .size = size, .is_dir = true}, progress);
    return;
  }
  if (loc.collect == Collect::MatchingFiles) {
    collect_files(loc, out, st, progress);
    return;
  }

  auto entries = dustpan::util::read_entries(loc.path);
  if (!entries) return;
  std::sort(entries->begin(), entries->end(), [](const auto& a, const auto& b){ return a.name < b.name; });
  const std::time_t now = std::time(nullptr);
  for (const auto& e : *entries) {
    if (st.stop_requested()) return;
    if (std::find(loc.exclude_names.begin(), loc.exclude_names.end(), e.name) != loc.exclude_names.end())
      continue;
    std::optional<int> age;
    if (loc.older_than_days > 0) {
      if (e.mtime > now - static_cast<std::time_t>(loc.older_than_days) * kSecondsPerDay) continue;
      age = static_cast<int>((now - e.mtime) / kSecondsPerDay);
    }
    uint64_t size = e.is_dir ? dustpan::util::directory_size(e.path, st) : e.size;
    if (size < loc.min_bytes) continue;
    found(out, FileItem{.path = e.path, .name = loc.label + e.name, .size = size,
                        .is_dir = e.is_dir, .age_days = age}, progress);
  }
}

void DirectoryProbe::collect_files(const Location& loc, ScanResult& out,
                                   std::stop_token st, dustpan::app::ProgressQueue* progress) const {
  std::vector<std::string> pending{loc.path};
  unsigned visited = 0;
  while (!pending.empty() && !st.stop_requested()) {
    std::string dir = std::move(pending.back());
    pending.pop_back();
    if (++visited % kWalkNoticeEvery == 0) walking(dir, progress);
    auto entries = dustpan::util::read_entries(dir);
    if (!entries) continue;
    for (auto& e : *entries) {
      if (e.is_dir) {
        pending.push_back(std::move(e.path));
        continue;
      }
      if (e.name.find(loc.name_contains) == std::string::npos) continue;
      if (e.size < loc.min_bytes) continue;
      found(out, FileItem{.path = e.path, .name = loc.label + e.name, .size = e.size}, progress);
    }
  }
}

void DirectoryProbe::walk_tree(const TreeMatch& tm, ScanResult& out,
                               std::stop_token st, dustpan::app::ProgressQueue* progress) const {
  std::vector<std::string> pending{tm.root};
  unsigned visited = 0;
  while (!pending.empty()) {
    if (st.stop_requested()) return;
    std::string dir = std::move(pending.back());
    pending.pop_back();
    if (++visited % kWalkNoticeEvery == 0) walking(dir, progress);
    auto entries = dustpan::util::read_entries(dir);
    if (!entries) continue;
    for (auto& e : *entries) {
      if (!e.is_dir) continue;
      if (should_skip_dir(e.path, tm.extra_skip)) continue;
      if (!tm.matches || !tm.matches(e.name, dir)) {
        pending.push_back(std::move(e.path));
        continue;
      }
      uint64_t size = dustpan::util::directory_size(e.path, st);
      if (size == 0) continue;
      std::string name = tm.glyph + " " + relative_label(tm.root, dir);
      if (tm.show_name) name += " (" + e.name + ")";
      found(out, FileItem{.path = e.path, .name = std::move(name), .size = size, .is_dir = true}, progress);
    }
  }
}

void DirectoryProbe::found(ScanResult& out, FileItem item, dustpan::app::ProgressQueue* progress) const {
  if (progress) {
    progress->try_push({.category = category_, .path = item.path, .bytes = item.size, .found = true});
  }
  out.add(std::move(item));
}

void DirectoryProbe::walking(const std::string& dir, dustpan::app::ProgressQueue* progress) const {
  if (progress) progress->try_push({.category = category_, .path = dir, .bytes = 0, .found = false});
}

} // namespace dustpan::probes
