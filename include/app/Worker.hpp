#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <vector>
#include "app/EventQueue.hpp"

namespace dustpan::app {

using Job = std::function<Event(std::stop_token)>;

// Where the state machine sends long-running work. The job's returned event
// must reach the event queue exactly once.
class IJobRunner {
public:
  virtual ~IJobRunner() = default;
  virtual void submit(Job job) = 0;
};

// One jthread per job; finished threads are reaped on the next submit.
// Destruction requests stop on every job still running and joins it.
class Worker final : public IJobRunner {
public:
  explicit Worker(EventQueue& out) : out_(out) {}
  ~Worker() override;
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void submit(Job job) override;
  [[nodiscard]] size_t running() const;

private:
  struct Task {
    std::shared_ptr<std::atomic<bool>> done;
    std::jthread thread;
  };
  void reap();

  EventQueue& out_;
  std::vector<Task> tasks_;
};

} // namespace dustpan::app
