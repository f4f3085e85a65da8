#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "app/Events.hpp"

namespace dustpan::app {

// Unbounded FIFO from workers to the interaction loop. Completion events are
// never dropped. An eventfd becomes readable whenever events are pending so
// the loop can poll() it next to stdin.
class EventQueue {
public:
  EventQueue();
  ~EventQueue();
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void push(Event ev);
  [[nodiscard]] std::optional<Event> try_pop();
#ifdef DUSTPAN_TESTING
  // Test-only blocking pop; the interaction loop polls fd() instead.
  [[nodiscard]] std::optional<Event> wait_pop(std::chrono::milliseconds timeout);
#endif
  [[nodiscard]] size_t size() const;

  // -1 if eventfd is unavailable; callers then fall back to a poll timeout.
  [[nodiscard]] int fd() const { return wake_fd_; }

private:
  void drain_wake();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Event> q_;
  int wake_fd_{-1};
};

#ifdef DUSTPAN_TESTING
inline std::optional<Event> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!cv_.wait_for(lk, timeout, [this]{ return !q_.empty(); })) return std::nullopt;
  Event ev = std::move(q_.front());
  q_.pop_front();
  if (q_.empty()) drain_wake();
  return ev;
}
#endif

} // namespace dustpan::app
