#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <stop_token>
#include <string>
#include "app/Events.hpp"
#include "app/LogWriter.hpp"
#include "app/ProgressQueue.hpp"
#include "app/SelectionModel.hpp"
#include "app/Worker.hpp"
#include "probes/ProbeRegistry.hpp"

namespace dustpan::app {

enum class State { Menu, Scanning, Results, Detail, Cleaning, DiskUsageReport };

enum class Key {
  Up, Down, PageUp, PageDown,
  Enter, Escape, Backspace, Space,
  MarkAll, ClearMarks, DeleteMarked, DeleteSelected,
  Quit,
};

enum class MenuItem { FullScan, DevScan, QuickClean, DiskUsage, Exit };

struct MenuEntry {
  MenuItem item;
  const char* title;
  const char* description;
};

inline constexpr std::array<MenuEntry, 5> kMenu{{
  {MenuItem::FullScan,   "Full System Scan",  "Caches, logs, trash, old downloads, Xcode, Homebrew"},
  {MenuItem::DevScan,    "Dev Scan",          "node_modules, venvs, target/, build outputs, package caches"},
  {MenuItem::QuickClean, "Quick Clean",       "Caches, logs and trash only"},
  {MenuItem::DiskUsage,  "Disk Usage Report", "Mounted filesystems (df)"},
  {MenuItem::Exit,       "Exit",              ""},
}};

[[nodiscard]] const char* state_name(State s);

// Live feedback for the scanning screen, fed from the progress queue.
struct ScanView {
  dustpan::probes::ScanProfile profile{};
  size_t probes{};
  size_t found{};
  uint64_t bytes{};
  std::deque<std::string> recent;  // newest last
  std::string current;
  std::chrono::steady_clock::time_point started{};
};

struct MachineOptions {
  dustpan::probes::ProbeContext probe_context;
  std::string df_command{"df -h"};
  // Overrides make_probes(profile, probe_context) when set
  std::function<dustpan::probes::ProbeSet(dustpan::probes::ScanProfile)> probe_factory;
};

// Sequences scanning, browsing, exploration and deletion. Runs on the
// interaction loop only; background work goes through the job runner and
// comes back as events. At most one scan and one deletion are in flight.
class StateMachine {
public:
  static constexpr size_t kRecentPaths = 10;

  StateMachine(IJobRunner& jobs, MachineOptions opts,
               ProgressQueue* progress = nullptr, LogWriter* log = nullptr);

  // Returns false when the user asked to quit.
  [[nodiscard]] bool on_key(Key k);
  void on_event(Event ev);
  void pump_progress();
  void set_page_rows(int rows) { page_rows_ = rows > 1 ? rows : 1; }

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] size_t menu_cursor() const { return menu_cursor_; }
  // Index into the sorted categories; == category count selects "Back".
  [[nodiscard]] size_t results_cursor() const { return results_cursor_; }
  [[nodiscard]] const SelectionModel& model() const { return model_; }
  [[nodiscard]] const ScanView& scan_view() const { return scan_; }
  [[nodiscard]] const std::string& status() const { return status_; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] const std::string& cleaning_label() const { return cleaning_label_; }
  [[nodiscard]] const dustpan::model::DiskUsageReport& disk_report() const { return disk_; }
  [[nodiscard]] bool disk_loading() const { return disk_loading_; }
  [[nodiscard]] size_t disk_scroll() const { return disk_scroll_; }
  [[nodiscard]] bool explore_pending() const { return explore_pending_; }
  [[nodiscard]] bool scan_in_flight() const { return scan_in_flight_; }
  [[nodiscard]] bool delete_in_flight() const { return delete_in_flight_; }
  [[nodiscard]] int page_rows() const { return page_rows_; }

private:
  bool on_menu_key(Key k);
  void on_results_key(Key k);
  void on_detail_key(Key k);
  void on_disk_key(Key k);

  void start_scan(dustpan::probes::ScanProfile profile);
  void start_disk_usage();
  void start_deletion(DeletionOrigin origin, std::string label, std::function<DeletionOutcome()> work);
  void request_explore(const dustpan::model::FileItem& dir, ExploreKind kind);
  void cancel_explore();
  void back_to_menu();

  void handle(ScanComplete& ev);
  void handle(ExploreComplete& ev);
  void handle(DeletionComplete& ev);
  void handle(DiskUsageReady& ev);
  void handle(ErrorEvent& ev);

  void clamp_results_cursor();
  void log(const std::string& line);

  IJobRunner& jobs_;
  MachineOptions opts_;
  ProgressQueue* progress_;
  LogWriter* log_;

  State state_{State::Menu};
  SelectionModel model_;
  ScanView scan_;
  size_t menu_cursor_{0};
  size_t results_cursor_{0};
  int page_rows_{10};

  bool scan_in_flight_{false};
  bool delete_in_flight_{false};
  bool explore_pending_{false};
  uint64_t explore_ticket_{0};
  std::stop_source explore_stop_;

  dustpan::model::DiskUsageReport disk_;
  bool disk_loading_{false};
  size_t disk_scroll_{0};

  std::string status_;
  std::string error_;
  std::string cleaning_label_;
};

} // namespace dustpan::app
