#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "model/DiskUsage.hpp"
#include "model/Snapshot.hpp"
#include "probes/ProbeRegistry.hpp"
#include "app/DeletionEngine.hpp"

namespace dustpan::app {

struct ScanComplete {
  dustpan::probes::ScanProfile profile{};
  dustpan::model::Snapshot snapshot;
  std::chrono::milliseconds elapsed{};
};

enum class ExploreKind { Push, Relist };

struct ExploreComplete {
  uint64_t ticket{};
  std::string category;
  dustpan::model::FileItem dir;
  ExploreKind kind{ExploreKind::Push};
  std::optional<std::vector<dustpan::model::FileItem>> items; // nullopt: could not open
};

struct DeletionComplete {
  DeletionOutcome outcome;
};

struct DiskUsageReady {
  dustpan::model::DiskUsageReport report;
};

enum class ErrorSource { Generic, Scan, Explore, Deletion, DiskUsage };

struct ErrorEvent {
  ErrorSource source{ErrorSource::Generic};
  std::string message;
  uint64_t ticket{};  // explore ticket for ErrorSource::Explore
};

// Completion events from background work, consumed in arrival order.
using Event = std::variant<ScanComplete, ExploreComplete, DeletionComplete, DiskUsageReady, ErrorEvent>;

} // namespace dustpan::app
