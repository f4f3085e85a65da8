#include "app/Worker.hpp"
#include <algorithm>
#include <exception>

namespace dustpan::app {

Worker::~Worker() {
  for (auto& t : tasks_) t.thread.request_stop();
  tasks_.clear();
}

void Worker::submit(Job job) {
  reap();
  auto done = std::make_shared<std::atomic<bool>>(false);
  EventQueue& out = out_;
  std::jthread th([&out, done, job = std::move(job)](std::stop_token st){
    try {
      out.push(job(st));
    } catch (const std::exception& e) {
      out.push(ErrorEvent{ErrorSource::Generic, e.what()});
    }
    done->store(true);
  });
  tasks_.push_back(Task{std::move(done), std::move(th)});
}

void Worker::reap() {
  std::erase_if(tasks_, [](const Task& t){ return t.done->load(); });
}

size_t Worker::running() const {
  return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                           [](const Task& t){ return !t.done->load(); }));
}

} // namespace dustpan::app
