#pragma once
#include <stop_token>
#include <string>
#include "model/FileItem.hpp"
#include "app/ProgressQueue.hpp"

namespace dustpan::probes {

// One independent category scan. Implementations do their own traversal and
// never throw: unreadable or vanished paths simply contribute nothing.
class ICategoryProbe {
public:
  virtual ~ICategoryProbe() = default;

  // Category display name, the aggregation key.
  [[nodiscard]] virtual const std::string& category() const = 0;

  // Produce this category's findings. The stop token is only signalled on
  // process shutdown; progress may be null.
  [[nodiscard]] virtual dustpan::model::ScanResult scan(std::stop_token st,
                                                        dustpan::app::ProgressQueue* progress) const = 0;
};

} // namespace dustpan::probes
