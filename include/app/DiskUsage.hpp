#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/DiskUsage.hpp"

namespace dustpan::app {

struct DiskUsageResult {
  bool ok{false};
  dustpan::model::DiskUsageReport report;
  std::string error;
};

// Parse `df -h` style output. The header line is skipped; both the GNU
// (6 columns) and BSD (9 columns, "iused" in the header) layouts are accepted
// and the trailing fields form the mount point. nullopt when no data row
// could be parsed.
[[nodiscard]] std::optional<std::vector<dustpan::model::DiskUsageRow>> parse_df_output(std::string_view text);

// Run the command through the shell and parse its stdout.
[[nodiscard]] DiskUsageResult run_disk_usage(const std::string& command);

// "averyveryverylong..." style clipping used for the filesystem column.
[[nodiscard]] std::string clip_label(const std::string& s, size_t max_len = 25);

} // namespace dustpan::app
