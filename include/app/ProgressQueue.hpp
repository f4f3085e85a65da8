#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace dustpan::app {

struct ScanProgress {
  std::string category;
  std::string path;
  uint64_t bytes{};     // size of the found item, 0 for walk notices
  bool found{false};    // false: just the directory currently being walked
};

// Bounded best-effort channel from probes to the UI. A full queue discards
// the update instead of blocking the sender.
class ProgressQueue {
public:
  static constexpr size_t kDefaultCapacity = 100;

  explicit ProgressQueue(size_t capacity = kDefaultCapacity);

  bool try_push(ScanProgress p);
  [[nodiscard]] std::optional<ScanProgress> try_pop();
  void clear();

  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] uint64_t dropped() const;

private:
  mutable std::mutex mu_;
  std::deque<ScanProgress> q_;
  size_t capacity_;
  uint64_t dropped_{0};
};

} // namespace dustpan::app
