#pragma once
#include <string>
#include <vector>

namespace dustpan::model {

struct DiskUsageRow {
  std::string filesystem;
  std::string size;
  std::string used;
  std::string avail;
  std::string capacity;   // e.g. "42%"
  std::string mounted_on;
};

struct DiskUsageReport {
  std::string command;    // what produced the rows
  std::vector<DiskUsageRow> rows;
};

} // namespace dustpan::model
