#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "model/Snapshot.hpp"
#include "app/DeletionEngine.hpp"
#ifdef DUSTPAN_TESTING
#include "util/DirSize.hpp"
#endif

namespace dustpan::app {

// Owns the current snapshot plus everything the detail view needs: the active
// category, the listing at the current depth, the breadcrumb and the marks.
// Single-threaded; fed by the state machine only.
//
// Marks are cleared whenever the listing is replaced (entering a category,
// exploring, going up), so they never refer to entries that are not shown.
class SelectionModel {
public:
  enum class UpResult {
    Rejected,     // already at the category root
    AtRoot,       // back at the category root, listing restored
    NeedsRelist,  // breadcrumb popped, caller must list current_dir()
  };

  void load(dustpan::model::Snapshot snap);
  [[nodiscard]] const dustpan::model::Snapshot& snapshot() const { return snap_; }

  bool enter_category(std::string_view name);
  void leave_category();
  [[nodiscard]] bool in_category() const { return !breadcrumb_.empty(); }
  [[nodiscard]] const std::string& active_category() const { return active_; }

  // Enter dir with its children already listed off-thread.
  bool push_directory(const dustpan::model::FileItem& dir, std::vector<dustpan::model::FileItem> children);
  UpResult go_up();
  void replace_listing(std::vector<dustpan::model::FileItem> items);

#ifdef DUSTPAN_TESTING
  // Test-only synchronous variants of the off-thread explore and relist.
  bool explore(const dustpan::model::FileItem& item);
  bool go_up_and_relist();
#endif

  [[nodiscard]] const std::vector<dustpan::model::FileItem>& listing() const { return listing_; }
  [[nodiscard]] uint64_t listing_total() const;
  [[nodiscard]] const std::vector<std::string>& breadcrumb() const { return breadcrumb_; }
  [[nodiscard]] size_t depth() const { return breadcrumb_.size(); }
  // Directory the listing shows; empty at the category root.
  [[nodiscard]] std::string current_dir() const { return dirs_.empty() ? std::string() : dirs_.back(); }

  bool toggle_mark(const std::string& path);
  bool toggle_mark_at_cursor();
  void mark_all();
  void clear_marks();
  [[nodiscard]] bool is_marked(const std::string& path) const { return marks_.contains(path); }
  [[nodiscard]] const dustpan::model::SelectionSet& marks() const { return marks_; }
  [[nodiscard]] uint64_t marked_bytes() const;

  [[nodiscard]] size_t cursor() const { return cursor_; }
  void move_cursor(int delta);
  void set_cursor(size_t pos);
  [[nodiscard]] const dustpan::model::FileItem* selected() const;

  // Drop removed paths (and anything below them) everywhere, shrink items
  // that contain a removed path, recompute totals and clamp the cursor.
  void apply_deletion(const std::vector<RemovedPath>& removed);

private:
  void show(std::vector<dustpan::model::FileItem> items);
  void clamp_cursor();
  void root_listing();

  dustpan::model::Snapshot snap_;
  std::string active_;
  std::vector<dustpan::model::FileItem> listing_;
  std::vector<std::string> breadcrumb_;   // [category, dir name, ...]
  std::vector<std::string> dirs_;         // absolute dir per breadcrumb segment after the first
  dustpan::model::SelectionSet marks_;
  size_t cursor_{0};
};

// True if path equals ancestor or lies below it.
[[nodiscard]] bool path_within(std::string_view path, std::string_view ancestor);

#ifdef DUSTPAN_TESTING
inline bool SelectionModel::explore(const dustpan::model::FileItem& item) {
  if (!in_category() || !item.is_dir) return false;
  auto children = dustpan::util::list_directory(item.path);
  if (!children) return false;
  return push_directory(item, std::move(*children));
}

inline bool SelectionModel::go_up_and_relist() {
  auto r = go_up();
  if (r == UpResult::Rejected) return false;
  if (r == UpResult::NeedsRelist) {
    auto items = dustpan::util::list_directory(current_dir());
    replace_listing(items ? std::move(*items) : std::vector<dustpan::model::FileItem>{});
  }
  return true;
}
#endif

} // namespace dustpan::app
