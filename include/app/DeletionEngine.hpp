#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "model/FileItem.hpp"

namespace dustpan::app {

enum class DeletionOrigin { Detail, Results };

struct RemovedPath {
  std::string path;
  uint64_t bytes{};
};

struct DeletionOutcome {
  std::string category;             // identity the result is applied against
  DeletionOrigin origin{DeletionOrigin::Detail};
  std::vector<RemovedPath> removed; // successes only
  uint64_t freed{};
  size_t requested{};
  // Single-item deletions report their failure; batches only list successes.
  bool ok{true};
  std::string failed_path;
  std::string error;
};

// Remove one entry recursively. A path that no longer exists frees 0 bytes
// and is still reported as removed. Directories are re-measured first.
[[nodiscard]] DeletionOutcome delete_one(const dustpan::model::FileItem& item);

// Remove every listing entry whose path is marked, in listing order. Freed
// bytes are the listing sizes of the successes; failures are skipped.
[[nodiscard]] DeletionOutcome delete_marked(const dustpan::model::SelectionSet& marked,
                                            const std::vector<dustpan::model::FileItem>& listing);

// Remove every item of a category (results view "clean").
[[nodiscard]] DeletionOutcome delete_category(const dustpan::model::ScanResult& result);

} // namespace dustpan::app
