#include "app/LogWriter.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace dustpan::app {

namespace {

std::tm local_now() {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);
  return tm;
}

} // namespace

LogWriter::LogWriter(std::filesystem::path log_dir) : log_dir_(std::move(log_dir)) {
  std::error_code ec;
  std::filesystem::create_directories(log_dir_, ec);
  if (ec) {
    std::fprintf(stderr, "dustpan: LogWriter: failed to create %s: %s\n",
                 log_dir_.c_str(), ec.message().c_str());
  }
}

LogWriter::~LogWriter() { stop(); }

void LogWriter::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void LogWriter::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void LogWriter::log(const std::string& line) {
  std::tm tm = local_now();
  char ts[32];
  std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
  {
    std::lock_guard<std::mutex> lk(mu_);
    pending_.push_back(std::string(ts) + line);
  }
  cv_.notify_one();
}

void LogWriter::run(std::stop_token st) {
  while (true) {
    std::deque<std::string> batch;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, st, [this]{ return !pending_.empty(); });
      batch.swap(pending_);
    }
    write_batch(batch);
    if (st.stop_requested()) break;
  }
  // Final drain so nothing logged before stop() is lost
  std::deque<std::string> rest;
  {
    std::lock_guard<std::mutex> lk(mu_);
    rest.swap(pending_);
  }
  write_batch(rest);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void LogWriter::write_batch(std::deque<std::string>& batch) {
  if (batch.empty()) return;
  auto required_path = chunk_path();
  // Rotate on day boundary
  if (required_path != current_path_ || !file_.is_open()) {
    if (file_.is_open()) {
      file_.flush();
      file_.close();
    }
    file_.clear();
    file_.open(required_path, std::ios::app);
    if (!file_) {
      // stderr belongs to the UI now: drop this batch, reopen on the next
      current_path_.clear();
      return;
    }
    current_path_ = required_path;
  }
  for (const auto& line : batch) {
    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_.put('\n');
  }
  file_.flush();
}

std::filesystem::path LogWriter::chunk_path() const {
  std::tm tm = local_now();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "dustpan_%04d-%02d-%02d.log",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return log_dir_ / buf;
}

} // namespace dustpan::app
