#include "app/EventQueue.hpp"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace dustpan::app {

EventQueue::EventQueue() {
  wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wake_fd_ < 0) {
    std::fprintf(stderr, "dustpan: eventfd() failed: %s\n", std::strerror(errno));
  }
}

EventQueue::~EventQueue() {
  if (wake_fd_ >= 0) { ::close(wake_fd_); wake_fd_ = -1; }
}

void EventQueue::push(Event ev) {
  {
    // Signalled under the lock so the eventfd is readable exactly while events are queued
    std::lock_guard<std::mutex> lk(mu_);
    q_.push_back(std::move(ev));
    if (wake_fd_ >= 0) {
      uint64_t one = 1;
      (void)::write(wake_fd_, &one, sizeof(one));
    }
  }
  cv_.notify_one();
}

void EventQueue::drain_wake() {
  if (wake_fd_ < 0) return;
  uint64_t v = 0;
  (void)::read(wake_fd_, &v, sizeof(v));
}

std::optional<Event> EventQueue::try_pop() {
  std::lock_guard<std::mutex> lk(mu_);
  if (q_.empty()) return std::nullopt;
  Event ev = std::move(q_.front());
  q_.pop_front();
  if (q_.empty()) drain_wake();
  return ev;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}

} // namespace dustpan::app
