#include "app/StateMachine.hpp"
#include "app/DiskUsage.hpp"
#include "app/ScanOrchestrator.hpp"
#include "util/DirSize.hpp"
#include "util/HumanBytes.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace dustpan::app {

using dustpan::model::FileItem;
using dustpan::probes::ScanProfile;
using dustpan::util::human_bytes;

namespace {

// Turn a failing job into an error event tagged with where it came from.
template <typename Fn>
Event guarded(ErrorSource source, uint64_t ticket, Fn&& fn) {
  try {
    return fn();
  } catch (const std::exception& e) {
    return ErrorEvent{source, e.what(), ticket};
  }
}

template <typename Fn>
Event guarded(ErrorSource source, Fn&& fn) {
  return guarded(source, 0, std::forward<Fn>(fn));
}

} // namespace

const char* state_name(State s) {
  switch (s) {
    case State::Menu: return "menu";
    case State::Scanning: return "scanning";
    case State::Results: return "results";
    case State::Detail: return "detail";
    case State::Cleaning: return "cleaning";
    case State::DiskUsageReport: return "disk-usage";
  }
  return "?";
}

StateMachine::StateMachine(IJobRunner& jobs, MachineOptions opts, ProgressQueue* progress, LogWriter* log)
    : jobs_(jobs), opts_(std::move(opts)), progress_(progress), log_(log) {}

void StateMachine::log(const std::string& line) {
  if (log_) log_->log(line);
}

bool StateMachine::on_key(Key k) {
  switch (state_) {
    case State::Menu:
      return on_menu_key(k);
    case State::DiskUsageReport:
      // q dismisses the report instead of exiting
      on_disk_key(k);
      return true;
    case State::Results:
      if (k == Key::Quit) return false;
      on_results_key(k);
      return true;
    case State::Detail:
      if (k == Key::Quit) return false;
      on_detail_key(k);
      return true;
    case State::Scanning:
    case State::Cleaning:
      // Nothing may start while a scan or deletion runs
      return k != Key::Quit;
  }
  return true;
}

bool StateMachine::on_menu_key(Key k) {
  switch (k) {
    case Key::Quit:
      return false;
    case Key::Up:
      if (menu_cursor_ > 0) --menu_cursor_;
      break;
    case Key::Down:
      if (menu_cursor_ + 1 < kMenu.size()) ++menu_cursor_;
      break;
    case Key::Enter:
      error_.clear();
      switch (kMenu[menu_cursor_].item) {
        case MenuItem::FullScan:   start_scan(ScanProfile::Broad); break;
        case MenuItem::DevScan:    start_scan(ScanProfile::Deep); break;
        case MenuItem::QuickClean: start_scan(ScanProfile::Quick); break;
        case MenuItem::DiskUsage:  start_disk_usage(); break;
        case MenuItem::Exit:       return false;
      }
      break;
    default:
      break;
  }
  return true;
}

void StateMachine::on_results_key(Key k) {
  const auto& cats = model_.snapshot().categories;
  const size_t rows = cats.size() + 1; // + "Back to Menu"
  switch (k) {
    case Key::Up:
      if (results_cursor_ > 0) --results_cursor_;
      break;
    case Key::Down:
      if (results_cursor_ + 1 < rows) ++results_cursor_;
      break;
    case Key::PageUp:
      results_cursor_ -= std::min(results_cursor_, static_cast<size_t>(page_rows_));
      break;
    case Key::PageDown:
      results_cursor_ = std::min(rows - 1, results_cursor_ + static_cast<size_t>(page_rows_));
      break;
    case Key::Escape:
      back_to_menu();
      break;
    case Key::Enter: {
      if (results_cursor_ >= cats.size()) {
        back_to_menu();
        break;
      }
      auto it = std::next(cats.begin(), static_cast<std::ptrdiff_t>(results_cursor_));
      std::string name = it->first;
      if (model_.enter_category(name)) {
        status_.clear();
        state_ = State::Detail;
      }
      break;
    }
    case Key::DeleteSelected: {
      if (results_cursor_ >= cats.size() || delete_in_flight_) break;
      auto it = std::next(cats.begin(), static_cast<std::ptrdiff_t>(results_cursor_));
      dustpan::model::ScanResult victim = it->second;
      std::string label = "Cleaning " + victim.category + " (" + std::to_string(victim.items.size()) +
                          " items, " + human_bytes(victim.total) + ")";
      start_deletion(DeletionOrigin::Results, std::move(label),
                     [victim = std::move(victim)]{ return delete_category(victim); });
      break;
    }
    default:
      break;
  }
}

void StateMachine::on_detail_key(Key k) {
  switch (k) {
    case Key::Up:       model_.move_cursor(-1); return;
    case Key::Down:     model_.move_cursor(1); return;
    case Key::PageUp:   model_.move_cursor(-page_rows_); return;
    case Key::PageDown: model_.move_cursor(page_rows_); return;
    case Key::Escape:
      cancel_explore();
      model_.leave_category();
      back_to_menu();
      return;
    case Key::Backspace: {
      cancel_explore();
      auto r = model_.go_up();
      if (r == SelectionModel::UpResult::Rejected) {
        model_.leave_category();
        clamp_results_cursor();
        status_.clear();
        state_ = State::Results;
      } else if (r == SelectionModel::UpResult::NeedsRelist) {
        FileItem dir{.path = model_.current_dir(), .name = model_.breadcrumb().back(), .is_dir = true};
        request_explore(dir, ExploreKind::Relist);
      }
      return;
    }
    default:
      break;
  }

  // The listing is about to be replaced: nothing may act on it
  if (explore_pending_) return;

  switch (k) {
    case Key::Enter:
      if (const auto* it = model_.selected(); it && it->is_dir) request_explore(*it, ExploreKind::Push);
      break;
    case Key::Space:
      model_.toggle_mark_at_cursor();
      break;
    case Key::MarkAll:
      model_.mark_all();
      break;
    case Key::ClearMarks:
      model_.clear_marks();
      break;
    case Key::DeleteMarked: {
      if (model_.marks().empty()) {
        status_ = "No items marked";
        break;
      }
      if (delete_in_flight_) break;
      auto marks = model_.marks();
      auto listing = model_.listing();
      std::string label = "Deleting " + std::to_string(marks.size()) + " marked items (" +
                          human_bytes(model_.marked_bytes()) + ")";
      start_deletion(DeletionOrigin::Detail, std::move(label),
                     [marks = std::move(marks), listing = std::move(listing)]{
                       return delete_marked(marks, listing);
                     });
      break;
    }
    case Key::DeleteSelected: {
      const auto* it = model_.selected();
      if (!it || delete_in_flight_) break;
      FileItem item = *it;
      std::string label = "Deleting " + item.name + " (" + human_bytes(item.size) + ")";
      start_deletion(DeletionOrigin::Detail, std::move(label),
                     [item = std::move(item)]{ return delete_one(item); });
      break;
    }
    default:
      break;
  }
}

void StateMachine::on_disk_key(Key k) {
  switch (k) {
    case Key::Quit:
    case Key::Escape:
    case Key::Backspace:
      back_to_menu();
      break;
    case Key::Up:
      if (disk_scroll_ > 0) --disk_scroll_;
      break;
    case Key::Down:
      if (disk_scroll_ + 1 < disk_.rows.size()) ++disk_scroll_;
      break;
    case Key::PageUp:
      disk_scroll_ -= std::min(disk_scroll_, static_cast<size_t>(page_rows_));
      break;
    case Key::PageDown:
      if (!disk_.rows.empty())
        disk_scroll_ = std::min(disk_.rows.size() - 1, disk_scroll_ + static_cast<size_t>(page_rows_));
      break;
    default:
      break;
  }
}

void StateMachine::back_to_menu() {
  status_.clear();
  state_ = State::Menu;
}

void StateMachine::start_scan(ScanProfile profile) {
  if (scan_in_flight_) return;
  auto probes = opts_.probe_factory ? opts_.probe_factory(profile)
                                    : dustpan::probes::make_probes(profile, opts_.probe_context);
  if (progress_) progress_->clear();
  scan_ = ScanView{};
  scan_.profile = profile;
  scan_.probes = probes.size();
  scan_.started = std::chrono::steady_clock::now();
  scan_in_flight_ = true;
  status_.clear();
  state_ = State::Scanning;
  log(std::string("scan start profile=") + dustpan::probes::profile_name(profile) +
      " probes=" + std::to_string(probes.size()));

  ProgressQueue* progress = progress_;
  jobs_.submit([probes = std::move(probes), progress, profile](std::stop_token st) -> Event {
    return guarded(ErrorSource::Scan, [&]() -> Event {
      auto t0 = std::chrono::steady_clock::now();
      ScanOrchestrator orchestrator(progress);
      auto snap = orchestrator.run(probes, st);
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
      return ScanComplete{profile, std::move(snap), elapsed};
    });
  });
}

void StateMachine::start_disk_usage() {
  disk_ = {};
  disk_.command = opts_.df_command;
  disk_scroll_ = 0;
  disk_loading_ = true;
  state_ = State::DiskUsageReport;
  jobs_.submit([cmd = opts_.df_command](std::stop_token) -> Event {
    return guarded(ErrorSource::DiskUsage, [&]() -> Event {
      auto res = run_disk_usage(cmd);
      if (!res.ok) return ErrorEvent{ErrorSource::DiskUsage, "Disk usage failed: " + res.error};
      return DiskUsageReady{std::move(res.report)};
    });
  });
}

void StateMachine::start_deletion(DeletionOrigin origin, std::string label,
                                  std::function<DeletionOutcome()> work) {
  if (delete_in_flight_) return;
  delete_in_flight_ = true;
  cleaning_label_ = std::move(label);
  status_.clear();
  state_ = State::Cleaning;
  log("delete start: " + cleaning_label_);
  std::string category = model_.active_category();
  jobs_.submit([work = std::move(work), origin, category = std::move(category)](std::stop_token) -> Event {
    return guarded(ErrorSource::Deletion, [&]() -> Event {
      DeletionOutcome out = work();
      out.origin = origin;
      if (out.category.empty()) out.category = category;
      return DeletionComplete{std::move(out)};
    });
  });
}

void StateMachine::request_explore(const FileItem& dir, ExploreKind kind) {
  const uint64_t ticket = ++explore_ticket_;
  explore_pending_ = true;
  // A newer request or a cancel stops the previous walk; so does worker shutdown
  explore_stop_.request_stop();
  explore_stop_ = std::stop_source{};
  jobs_.submit([ticket, dir, kind, stop = explore_stop_,
                category = model_.active_category()](std::stop_token st) mutable -> Event {
    std::stop_callback link(st, [&stop]{ stop.request_stop(); });
    return guarded(ErrorSource::Explore, ticket, [&]() -> Event {
      return ExploreComplete{ticket, category, dir, kind,
                             dustpan::util::list_directory(dir.path, stop.get_token())};
    });
  });
}

void StateMachine::cancel_explore() {
  explore_stop_.request_stop();
  ++explore_ticket_;
  explore_pending_ = false;
}

void StateMachine::pump_progress() {
  if (!progress_) return;
  while (auto p = progress_->try_pop()) {
    if (state_ != State::Scanning) continue;
    if (p->found) {
      ++scan_.found;
      scan_.bytes += p->bytes;
      scan_.recent.push_back(p->path);
      while (scan_.recent.size() > kRecentPaths) scan_.recent.pop_front();
    } else {
      scan_.current = p->path;
    }
  }
}

void StateMachine::on_event(Event ev) {
  if (auto* e = std::get_if<ScanComplete>(&ev)) handle(*e);
  else if (auto* e = std::get_if<ExploreComplete>(&ev)) handle(*e);
  else if (auto* e = std::get_if<DeletionComplete>(&ev)) handle(*e);
  else if (auto* e = std::get_if<DiskUsageReady>(&ev)) handle(*e);
  else if (auto* e = std::get_if<ErrorEvent>(&ev)) handle(*e);
}

void StateMachine::handle(ScanComplete& ev) {
  scan_in_flight_ = false;
  const size_t items = ev.snapshot.item_count();
  log(std::string("scan done profile=") + dustpan::probes::profile_name(ev.profile) +
      " categories=" + std::to_string(ev.snapshot.categories.size()) +
      " items=" + std::to_string(items) +
      " bytes=" + std::to_string(ev.snapshot.grand_total) +
      " elapsed_ms=" + std::to_string(ev.elapsed.count()));
  model_.load(std::move(ev.snapshot));
  results_cursor_ = 0;
  if (progress_) progress_->clear();
  if (state_ != State::Scanning) return;
  status_ = model_.snapshot().empty() ? "Nothing to clean" : std::string();
  state_ = State::Results;
}

void StateMachine::handle(ExploreComplete& ev) {
  if (ev.ticket != explore_ticket_ || ev.category != model_.active_category()) return;
  explore_pending_ = false;
  if (!ev.items) {
    status_ = "Cannot open " + ev.dir.path;
    if (ev.kind == ExploreKind::Relist) model_.replace_listing({});
    return;
  }
  status_.clear();
  if (ev.kind == ExploreKind::Push) model_.push_directory(ev.dir, std::move(*ev.items));
  else model_.replace_listing(std::move(*ev.items));
}

void StateMachine::handle(DeletionComplete& ev) {
  delete_in_flight_ = false;
  const auto& out = ev.outcome;
  for (const auto& r : out.removed) log("deleted " + r.path + " bytes=" + std::to_string(r.bytes));

  model_.apply_deletion(out.removed);
  clamp_results_cursor();

  if (!out.ok) {
    log("delete failed " + out.failed_path + ": " + out.error);
    status_ = "Could not delete " + out.failed_path + ": " + out.error;
  } else if (out.origin == DeletionOrigin::Results) {
    status_ = "Cleaned " + out.category + ": " + std::to_string(out.removed.size()) + " items (" +
              human_bytes(out.freed) + ")";
  } else if (out.requested == 1 && out.removed.size() == 1) {
    const auto& p = out.removed.front().path;
    status_ = "Deleted " + p.substr(p.rfind('/') + 1) + " (" + human_bytes(out.freed) + ")";
  } else {
    status_ = "Deleted " + std::to_string(out.removed.size()) + " items (" + human_bytes(out.freed) + ")";
  }
  if (out.ok && out.removed.size() < out.requested) {
    status_ += ", " + std::to_string(out.requested - out.removed.size()) + " failed";
  }

  if (state_ != State::Cleaning) return;
  if (out.origin == DeletionOrigin::Detail && model_.in_category()) state_ = State::Detail;
  else state_ = State::Results;
}

void StateMachine::handle(DiskUsageReady& ev) {
  disk_loading_ = false;
  disk_ = std::move(ev.report);
  disk_scroll_ = 0;
}

void StateMachine::handle(ErrorEvent& ev) {
  log("error: " + ev.message);
  switch (ev.source) {
    case ErrorSource::DiskUsage:
      disk_loading_ = false;
      error_ = ev.message;
      if (state_ == State::DiskUsageReport) state_ = State::Menu;
      break;
    case ErrorSource::Scan:
      scan_in_flight_ = false;
      error_ = ev.message;
      if (state_ == State::Scanning) state_ = State::Menu;
      break;
    case ErrorSource::Deletion:
      delete_in_flight_ = false;
      status_ = ev.message;
      if (state_ == State::Cleaning) state_ = model_.in_category() ? State::Detail : State::Results;
      break;
    case ErrorSource::Explore:
      if (ev.ticket != explore_ticket_) break;
      explore_pending_ = false;
      status_ = ev.message;
      break;
    case ErrorSource::Generic:
      error_ = ev.message;
      break;
  }
}

void StateMachine::clamp_results_cursor() {
  const size_t rows = model_.snapshot().categories.size() + 1;
  if (results_cursor_ >= rows) results_cursor_ = rows - 1;
}

} // namespace dustpan::app
