#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "probes/ICategoryProbe.hpp"

namespace dustpan::probes {

enum class Collect {
  Whole,          // the location itself is one item
  Children,       // each immediate entry is an item
  MatchingFiles,  // every file below whose name contains `name_contains`
};

// A fixed, well-known location. Missing or unreadable locations are skipped.
struct Location {
  std::string path;
  std::string label;              // Whole: item name. Children: prefix for the entry name.
  Collect collect{Collect::Whole};
  uint64_t min_bytes{1};          // smaller findings are not reported
  std::string name_contains;      // MatchingFiles only
  int older_than_days{0};         // Children only: keep entries whose mtime is older, sets age_days
  std::vector<std::string> exclude_names; // Children only
};

// Walk of a whole tree (normally $HOME) looking for directories by name.
// A matched directory is measured and never descended into.
struct TreeMatch {
  std::string root;
  std::function<bool(const std::string& name, const std::string& parent)> matches;
  std::string glyph;              // prefixed to the project path in the item name
  bool show_name{false};          // append " (<dirname>)" to the item name
  std::vector<std::string> extra_skip;
};

// The single probe implementation behind every category: a list of fixed
// locations plus an optional tree walk.
class DirectoryProbe final : public ICategoryProbe {
public:
  DirectoryProbe(std::string category, std::vector<Location> locations,
                 std::optional<TreeMatch> tree = std::nullopt);

  [[nodiscard]] const std::string& category() const override { return category_; }
  [[nodiscard]] dustpan::model::ScanResult scan(std::stop_token st,
                                                dustpan::app::ProgressQueue* progress) const override;

  [[nodiscard]] const std::vector<Location>& locations() const { return locations_; }
  [[nodiscard]] bool walks_tree() const { return tree_.has_value(); }

private:
  void scan_location(const Location& loc, dustpan::model::ScanResult& out,
                     std::stop_token st, dustpan::app::ProgressQueue* progress) const;
  void collect_files(const Location& loc, dustpan::model::ScanResult& out,
                     std::stop_token st, dustpan::app::ProgressQueue* progress) const;
  void walk_tree(const TreeMatch& tm, dustpan::model::ScanResult& out,
                 std::stop_token st, dustpan::app::ProgressQueue* progress) const;
  void found(dustpan::model::ScanResult& out, dustpan::model::FileItem item,
             dustpan::app::ProgressQueue* progress) const;
  void walking(const std::string& dir, dustpan::app::ProgressQueue* progress) const;

  std::string category_;
  std::vector<Location> locations_;
  std::optional<TreeMatch> tree_;
};

} // namespace dustpan::probes
