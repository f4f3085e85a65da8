#include "app/SelectionModel.hpp"

#include <algorithm>

namespace dustpan::app {

using dustpan::model::FileItem;

bool path_within(std::string_view path, std::string_view ancestor) {
  if (ancestor.empty() || !path.starts_with(ancestor)) return false;
  if (path.size() == ancestor.size()) return true;
  return ancestor.back() == '/' || path[ancestor.size()] == '/';
}

namespace {

void sort_by_size(std::vector<FileItem>& items) {
  std::stable_sort(items.begin(), items.end(), [](const FileItem& a, const FileItem& b){
    return a.size > b.size;
  });
}

std::string base_name(const std::string& path) {
  auto p = path;
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  auto slash = p.rfind('/');
  return slash == std::string::npos ? p : p.substr(slash + 1);
}

// Rebuild items without removed entries; ancestors of a removed entry are
// replaced by a shrunk copy.
bool prune(std::vector<FileItem>& items, const std::vector<RemovedPath>& removed) {
  bool changed = false;
  std::vector<FileItem> kept;
  kept.reserve(items.size());
  for (auto& it : items) {
    bool gone = false;
    uint64_t shrink = 0;
    for (const auto& r : removed) {
      if (path_within(it.path, r.path)) { gone = true; break; }
      if (path_within(r.path, it.path)) shrink += r.bytes;
    }
    if (gone) { changed = true; continue; }
    if (shrink > 0) {
      FileItem copy = it;
      copy.size = shrink >= copy.size ? 0 : copy.size - shrink;
      kept.push_back(std::move(copy));
      changed = true;
      continue;
    }
    kept.push_back(std::move(it));
  }
  items = std::move(kept);
  return changed;
}

} // namespace

void SelectionModel::load(dustpan::model::Snapshot snap) {
  snap_ = std::move(snap);
  snap_.recompute();
  leave_category();
}

bool SelectionModel::enter_category(std::string_view name) {
  const auto* r = snap_.find(name);
  if (!r) return false;
  breadcrumb_.assign(1, std::string(name));
  active_ = std::string(name);
  dirs_.clear();
  root_listing();
  return true;
}

void SelectionModel::leave_category() {
  for (auto it = snap_.categories.begin(); it != snap_.categories.end(); ) {
    if (it->second.items.empty()) it = snap_.categories.erase(it);
    else ++it;
  }
  active_.clear();
  breadcrumb_.clear();
  dirs_.clear();
  listing_.clear();
  marks_.clear();
  cursor_ = 0;
}

void SelectionModel::root_listing() {
  std::vector<FileItem> items;
  if (const auto* r = snap_.find(active_)) items = r->items;
  sort_by_size(items);
  show(std::move(items));
}

bool SelectionModel::push_directory(const FileItem& dir, std::vector<FileItem> children) {
  if (!in_category() || !dir.is_dir) return false;
  breadcrumb_.push_back(base_name(dir.path));
  dirs_.push_back(dir.path);
  sort_by_size(children);
  show(std::move(children));
  return true;
}

SelectionModel::UpResult SelectionModel::go_up() {
  if (breadcrumb_.size() <= 1) return UpResult::Rejected;
  breadcrumb_.pop_back();
  dirs_.pop_back();
  marks_.clear();
  if (breadcrumb_.size() == 1) {
    root_listing();
    return UpResult::AtRoot;
  }
  return UpResult::NeedsRelist;
}

void SelectionModel::replace_listing(std::vector<FileItem> items) {
  sort_by_size(items);
  show(std::move(items));
}

void SelectionModel::show(std::vector<FileItem> items) {
  listing_ = std::move(items);
  marks_.clear();
  cursor_ = 0;
}

uint64_t SelectionModel::listing_total() const {
  uint64_t t = 0;
  for (const auto& it : listing_) t += it.size;
  return t;
}

bool SelectionModel::toggle_mark(const std::string& path) {
  auto in_listing = std::any_of(listing_.begin(), listing_.end(),
                                [&](const FileItem& it){ return it.path == path; });
  if (!in_listing) return false;
  if (!marks_.erase(path)) marks_.insert(path);
  return true;
}

bool SelectionModel::toggle_mark_at_cursor() {
  const auto* it = selected();
  return it && toggle_mark(it->path);
}

void SelectionModel::mark_all() {
  for (const auto& it : listing_) marks_.insert(it.path);
}

void SelectionModel::clear_marks() { marks_.clear(); }

uint64_t SelectionModel::marked_bytes() const {
  uint64_t t = 0;
  for (const auto& it : listing_)
    if (marks_.contains(it.path)) t += it.size;
  return t;
}

void SelectionModel::move_cursor(int delta) {
  if (listing_.empty()) { cursor_ = 0; return; }
  long long pos = static_cast<long long>(cursor_) + delta;
  long long last = static_cast<long long>(listing_.size()) - 1;
  cursor_ = static_cast<size_t>(std::clamp(pos, 0LL, last));
}

void SelectionModel::set_cursor(size_t pos) {
  cursor_ = pos;
  clamp_cursor();
}

void SelectionModel::clamp_cursor() {
  if (listing_.empty()) cursor_ = 0;
  else if (cursor_ >= listing_.size()) cursor_ = listing_.size() - 1;
}

const FileItem* SelectionModel::selected() const {
  if (cursor_ >= listing_.size()) return nullptr;
  return &listing_[cursor_];
}

void SelectionModel::apply_deletion(const std::vector<RemovedPath>& removed) {
  if (removed.empty()) return;
  for (auto it = snap_.categories.begin(); it != snap_.categories.end(); ) {
    prune(it->second.items, removed);
    // An emptied open category is dropped when it is left
    if (it->second.items.empty() && it->first != active_) it = snap_.categories.erase(it);
    else ++it;
  }
  snap_.recompute();

  if (prune(listing_, removed)) sort_by_size(listing_);
  for (auto m = marks_.begin(); m != marks_.end(); ) {
    bool gone = std::any_of(removed.begin(), removed.end(),
                            [&](const RemovedPath& r){ return path_within(*m, r.path); });
    if (gone) m = marks_.erase(m); else ++m;
  }
  clamp_cursor();
}

} // namespace dustpan::app
