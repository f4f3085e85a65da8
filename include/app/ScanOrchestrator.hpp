#pragma once
#include <mutex>
#include <stop_token>
#include "model/Snapshot.hpp"
#include "probes/ProbeRegistry.hpp"
#include "app/ProgressQueue.hpp"

namespace dustpan::app {

// Lock-guarded merge target shared by the probe threads of one scan run.
class ScanAccumulator {
public:
  // Merge one probe's findings. Empty categories (total 0) are dropped;
  // results for a category already present are appended to it.
  void add(dustpan::model::ScanResult&& result);

  // Hand the merged snapshot over, leaving the accumulator empty.
  [[nodiscard]] dustpan::model::Snapshot take();

private:
  std::mutex mu_;
  dustpan::model::Snapshot snap_;
};

// Runs every probe of a set concurrently and waits for all of them.
class ScanOrchestrator {
public:
  explicit ScanOrchestrator(ProgressQueue* progress = nullptr) : progress_(progress) {}

  [[nodiscard]] dustpan::model::Snapshot run(const dustpan::probes::ProbeSet& probes,
                                             std::stop_token st = {}) const;

private:
  ProgressQueue* progress_;
};

} // namespace dustpan::app
