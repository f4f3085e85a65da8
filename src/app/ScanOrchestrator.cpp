#include "app/ScanOrchestrator.hpp"
#include <thread>
#include <vector>

namespace dustpan::app {

void ScanAccumulator::add(dustpan::model::ScanResult&& result) {
  result.recompute_total();
  if (result.total == 0) return;
  std::lock_guard<std::mutex> lk(mu_);
  auto* existing = snap_.find(result.category);
  if (existing) {
    for (auto& it : result.items) existing->add(std::move(it));
  } else {
    std::string key = result.category;
    snap_.categories.emplace(std::move(key), std::move(result));
  }
  snap_.recompute();
}

dustpan::model::Snapshot ScanAccumulator::take() {
  std::lock_guard<std::mutex> lk(mu_);
  dustpan::model::Snapshot out = std::move(snap_);
  snap_ = {};
  out.recompute();
  return out;
}

dustpan::model::Snapshot ScanOrchestrator::run(const dustpan::probes::ProbeSet& probes,
                                               std::stop_token st) const {
  ScanAccumulator acc;
  {
    std::vector<std::jthread> workers;
    workers.reserve(probes.size());
    for (const auto& probe : probes) {
      if (!probe) continue;
      workers.emplace_back([&acc, probe, st, progress = progress_]{
        acc.add(probe->scan(st, progress));
      });
    }
    // jthread joins on scope exit: no snapshot until every probe is done
  }
  return acc.take();
}

} // namespace dustpan::app
