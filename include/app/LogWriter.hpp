#pragma once

#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace dustpan::app {

// Session log. log() stamps the line and enqueues it; a background thread
// appends queued lines to dustpan_YYYY-MM-DD.log under the log directory.
class LogWriter {
public:
  explicit LogWriter(std::filesystem::path log_dir);
  ~LogWriter();
  LogWriter(const LogWriter&) = delete;
  LogWriter& operator=(const LogWriter&) = delete;

  void start();
  void stop();

  // Thread-safe; lines logged before start() are written once it runs.
  void log(const std::string& line);

  [[nodiscard]] const std::filesystem::path& dir() const { return log_dir_; }
  [[nodiscard]] std::filesystem::path chunk_path() const;

private:
  void run(std::stop_token st);
  void write_batch(std::deque<std::string>& batch);

  std::filesystem::path log_dir_;
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<std::string> pending_;
  // Owned by the writer thread
  std::ofstream file_;
  std::filesystem::path current_path_;
  std::jthread thread_;
};

} // namespace dustpan::app
