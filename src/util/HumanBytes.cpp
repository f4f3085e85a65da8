#include "util/HumanBytes.hpp"
#include <cmath>
#include <cstdio>

namespace dustpan::util {

std::string human_bytes(uint64_t bytes) {
  static constexpr const char* units[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
  char buf[32];
  if (bytes < 10) {
    std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    return buf;
  }
  const double b = static_cast<double>(bytes);
  int e = static_cast<int>(std::floor(std::log(b) / std::log(1000.0)));
  if (e < 0) e = 0;
  if (e > 6) e = 6;
  double val = std::floor(b / std::pow(1000.0, e) * 10.0 + 0.5) / 10.0;
  if (val < 10.0) std::snprintf(buf, sizeof(buf), "%.1f %s", val, units[e]);
  else std::snprintf(buf, sizeof(buf), "%.0f %s", val, units[e]);
  return buf;
}

std::string age_label(int days) {
  if (days < 0) days = 0;
  if (days < 14) return std::to_string(days) + "d";
  if (days < 365) return std::to_string(days / 7) + "w";
  return std::to_string(days / 365) + "y";
}

} // namespace dustpan::util
