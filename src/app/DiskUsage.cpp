#include "app/DiskUsage.hpp"

#include <sys/wait.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>

namespace dustpan::app {

namespace {

std::vector<std::string> split_ws(std::string_view line) {
  std::vector<std::string> out;
  std::istringstream ss{std::string(line)};
  std::string f;
  while (ss >> f) out.push_back(std::move(f));
  return out;
}

} // namespace

std::string clip_label(const std::string& s, size_t max_len) {
  if (s.size() <= max_len || max_len < 4) return s;
  return s.substr(0, max_len - 3) + "...";
}

std::optional<std::vector<dustpan::model::DiskUsageRow>> parse_df_output(std::string_view text) {
  std::vector<dustpan::model::DiskUsageRow> rows;
  bool header_seen = false;
  bool bsd = false;
  std::string carried; // GNU df puts over-long device names on a line of their own
  size_t pos = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() : nl + 1;
    auto fields = split_ws(line);
    if (fields.empty()) continue;
    if (!header_seen) {
      header_seen = true;
      bsd = line.find("iused") != std::string_view::npos;
      continue;
    }
    if (fields.size() == 1 && carried.empty()) {
      carried = fields[0];
      continue;
    }
    if (!carried.empty()) {
      fields.insert(fields.begin(), std::move(carried));
      carried.clear();
    }
    const size_t mount_at = bsd ? 8 : 5;
    if (fields.size() <= mount_at) continue;
    dustpan::model::DiskUsageRow r;
    r.filesystem = clip_label(fields[0]);
    r.size = fields[1];
    r.used = fields[2];
    r.avail = fields[3];
    r.capacity = fields[4];
    for (size_t i = mount_at; i < fields.size(); ++i) {
      if (i > mount_at) r.mounted_on += ' ';
      r.mounted_on += fields[i];
    }
    rows.push_back(std::move(r));
  }
  if (rows.empty()) return std::nullopt;
  return rows;
}

DiskUsageResult run_disk_usage(const std::string& command) {
  DiskUsageResult res;
  res.report.command = command;
  std::string cmd = command + " 2>/dev/null";
  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) {
    res.error = "failed to run '" + command + "': " + std::strerror(errno);
    return res;
  }
  std::string out;
  char buf[512];
  while (std::fgets(buf, sizeof(buf), fp)) out += buf;
  int status = ::pclose(fp);

  // df exits 1 when a single mount is unreadable; rows still count
  auto rows = parse_df_output(out);
  if (rows) {
    res.ok = true;
    res.report.rows = std::move(*rows);
    return res;
  }
  if (status == -1) {
    res.error = "failed to run '" + command + "': " + std::strerror(errno);
  } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    res.error = "'" + command + "' exited with status " + std::to_string(WEXITSTATUS(status));
  } else {
    res.error = "no filesystems in '" + command + "' output";
  }
  return res;
}

} // namespace dustpan::app
