#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include <memory>
#include <string>
#include <vector>

using dustpan::app::Key;
using dustpan::app::StateMachine;
using dustpan::model::FileItem;
using dustpan::model::ScanResult;

namespace {

class InlineRunner final : public dustpan::app::IJobRunner {
public:
  StateMachine* sm{nullptr};
  void submit(dustpan::app::Job job) override { queued_.push_back(std::move(job)); }
  void flush() {
    while (!queued_.empty()) {
      auto job = std::move(queued_.front());
      queued_.erase(queued_.begin());
      sm->on_event(job(std::stop_token{}));
    }
  }
private:
  std::vector<dustpan::app::Job> queued_;
};

class CannedProbe final : public dustpan::probes::ICategoryProbe {
public:
  explicit CannedProbe(std::string name, std::vector<FileItem> items)
      : name_(std::move(name)), items_(std::move(items)) {}
  const std::string& category() const override { return name_; }
  ScanResult scan(std::stop_token, dustpan::app::ProgressQueue*) const override {
    ScanResult r;
    r.category = name_;
    for (const auto& it : items_) r.add(it);
    return r;
  }
private:
  std::string name_;
  std::vector<FileItem> items_;
};

std::string joined(const std::vector<std::string>& lines) {
  std::string all;
  for (const auto& l : lines) all += l + "\n";
  return all;
}

bool contains(const std::vector<std::string>& lines, const std::string& needle) {
  return joined(lines).find(needle) != std::string::npos;
}

dustpan::app::MachineOptions canned_options() {
  dustpan::app::MachineOptions opts;
  opts.probe_factory = [](dustpan::probes::ScanProfile) -> dustpan::probes::ProbeSet {
    return {std::make_shared<CannedProbe>("Trash", std::vector<FileItem>{
              {.path = "/nonexistent/dustpan/t1", .name = "t1", .size = 1500},
              {.path = "/nonexistent/dustpan/t2", .name = "t2", .size = 500, .age_days = 40}})};
  };
  return opts;
}

} // namespace

TEST(format_display_cols_ignores_sgr) {
  ASSERT_EQ(dustpan::ui::display_cols("abc"), 3);
  ASSERT_EQ(dustpan::ui::display_cols("\x1B[31mabc\x1B[0m"), 3);
}

TEST(format_trunc_pad_exact_width) {
  ASSERT_EQ(dustpan::ui::trunc_pad("ab", 5), std::string("ab   "));
  ASSERT_EQ(dustpan::ui::display_cols(dustpan::ui::trunc_pad("abcdefghij", 5)), 5);
  ASSERT_EQ(dustpan::ui::rpad_trunc("7", 3), std::string("  7"));
  ASSERT_EQ(dustpan::ui::display_cols(dustpan::ui::lr_align(20, "left", "right")), 20);
}

TEST(box_has_requested_height_and_width) {
  auto box = dustpan::ui::make_box("Title", {"one", "two"}, 30, 5);
  ASSERT_EQ(box.size(), 7u);
  for (const auto& l : box) ASSERT_EQ(dustpan::ui::display_cols(l), 30);
  ASSERT_TRUE(box.front().find("[ Title ]") != std::string::npos);
}

TEST(viewport_rows_has_floor) {
  ASSERT_EQ(dustpan::ui::detail_viewport_rows(10), 5);
  ASSERT_EQ(dustpan::ui::detail_viewport_rows(40), 25);
}

TEST(render_menu_lists_entries) {
  InlineRunner jobs;
  StateMachine sm(jobs, canned_options());
  auto lines = dustpan::ui::render_lines(sm, 100, 30);
  ASSERT_EQ(lines.size(), 30u);
  ASSERT_TRUE(contains(lines, "Full System Scan"));
  ASSERT_TRUE(contains(lines, "Dev Scan"));
  ASSERT_TRUE(contains(lines, "Quick Clean"));
  ASSERT_TRUE(contains(lines, "Disk Usage Report"));
  ASSERT_TRUE(contains(lines, "Exit"));
}

TEST(render_results_and_detail) {
  InlineRunner jobs;
  StateMachine sm(jobs, canned_options());
  jobs.sm = &sm;
  ASSERT_TRUE(sm.on_key(Key::Enter));
  ASSERT_TRUE(contains(dustpan::ui::render_lines(sm, 100, 30), "Scanning"));
  jobs.flush();

  auto results = dustpan::ui::render_lines(sm, 100, 30);
  ASSERT_TRUE(contains(results, "Trash"));
  ASSERT_TRUE(contains(results, "2 items"));
  ASSERT_TRUE(contains(results, "TOTAL"));
  ASSERT_TRUE(contains(results, "2.0 kB"));
  ASSERT_TRUE(contains(results, "Back to Menu"));

  ASSERT_TRUE(sm.on_key(Key::Enter));
  ASSERT_TRUE(sm.on_key(Key::Space));
  auto detail = dustpan::ui::render_lines(sm, 100, 30);
  ASSERT_EQ(detail.size(), 30u);
  ASSERT_TRUE(contains(detail, "t1"));
  ASSERT_TRUE(contains(detail, "5w"));
  ASSERT_TRUE(contains(detail, "Total: 2.0 kB"));
  ASSERT_TRUE(contains(detail, "Marked: 1 items (1.5 kB)"));
}

TEST(render_menu_shows_error_banner) {
  InlineRunner jobs;
  dustpan::app::MachineOptions opts;
  opts.df_command = "false";
  StateMachine sm(jobs, opts);
  jobs.sm = &sm;
  for (int i = 0; i < 3; ++i) ASSERT_TRUE(sm.on_key(Key::Down));
  ASSERT_TRUE(sm.on_key(Key::Enter));
  ASSERT_TRUE(contains(dustpan::ui::render_lines(sm, 100, 30), "Running false"));
  jobs.flush();
  ASSERT_TRUE(contains(dustpan::ui::render_lines(sm, 100, 30), "Error: Disk usage failed"));
}

TEST(render_disk_usage_table) {
  InlineRunner jobs;
  dustpan::app::MachineOptions opts;
  opts.df_command = "printf 'Filesystem Size Used Avail Use%% Mounted on\\ntmpfs 8G 1G 7G 93%% /run\\n'";
  StateMachine sm(jobs, opts);
  jobs.sm = &sm;
  for (int i = 0; i < 3; ++i) ASSERT_TRUE(sm.on_key(Key::Down));
  ASSERT_TRUE(sm.on_key(Key::Enter));
  jobs.flush();
  auto lines = dustpan::ui::render_lines(sm, 100, 30);
  ASSERT_TRUE(contains(lines, "Mounted on"));
  ASSERT_TRUE(contains(lines, "tmpfs"));
  ASSERT_TRUE(contains(lines, "93%"));
  ASSERT_TRUE(contains(lines, "/run"));
}

TEST(render_tiny_terminal_is_clamped) {
  InlineRunner jobs;
  StateMachine sm(jobs, canned_options());
  auto lines = dustpan::ui::render_lines(sm, 5, 2);
  ASSERT_EQ(lines.size(), 6u);
}
