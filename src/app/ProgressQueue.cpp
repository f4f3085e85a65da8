#include "app/ProgressQueue.hpp"

namespace dustpan::app {

ProgressQueue::ProgressQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool ProgressQueue::try_push(ScanProgress p) {
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.size() >= capacity_) {
    ++dropped_;
    return false;
  }
  q_.push_back(std::move(p));
  return true;
}

std::optional<ScanProgress> ProgressQueue::try_pop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.empty()) return std::nullopt;
  ScanProgress p = std::move(q_.front());
  q_.pop_front();
  return p;
}

void ProgressQueue::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  q_.clear();
}

size_t ProgressQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

uint64_t ProgressQueue::dropped() const {
  std::lock_guard<std::mutex> lk(mu_);
  return dropped_;
}

} // namespace dustpan::app
