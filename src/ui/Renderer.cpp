#include "ui/Renderer.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "ui/Formatting.hpp"
#include "probes/ProbeRegistry.hpp"
#include "util/HumanBytes.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace dustpan::ui {

using dustpan::app::State;
using dustpan::app::StateMachine;
using dustpan::util::human_bytes;

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, int min_height) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  int content_lines = std::max((int)lines.size(), min_height);
  for (int i = 0; i < content_lines; ++i) {
    std::string ln = (i < (int)lines.size()) ? lines[i] : std::string();
    std::string cell = trunc_pad(ln, iw);
    if (cell.find('\x1B') != std::string::npos) cell += sgr_reset();
    out.push_back(V + cell + V);
  }
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::string colorize_line(const std::string& s) {
  if (!tty_stdout()) return s;
  const auto& colors = config().colors;
  const bool uni = use_unicode();
  const char* V = uni ? "│" : "|";
  const size_t vlen = std::strlen(V);

  auto is_border = [&](const std::string& str){
    if (str.empty()) return false;
    if (str.find(V) != std::string::npos) return false;
    if (uni) return str.rfind("╭",0)==0 || str.rfind("╰",0)==0;
    return str.rfind("+",0)==0;
  };

  if (is_border(s)) {
    size_t lb = s.find('[');
    size_t rb = (lb!=std::string::npos) ? s.find(']', lb+1) : std::string::npos;
    if (lb != std::string::npos && rb != std::string::npos && rb > lb) {
      std::string pre = s.substr(0, lb);
      std::string mid = s.substr(lb, rb - lb + 1);
      std::string suf = s.substr(rb + 1);
      return colors.border + pre + colors.accent + sgr_bold() + mid + sgr_reset() + colors.border + suf + sgr_reset();
    }
    return colors.border + s + sgr_reset();
  }

  size_t fpos = s.find(V);
  size_t lpos = s.rfind(V);
  if (fpos != std::string::npos && lpos != std::string::npos && lpos > fpos) {
    std::string pre = s.substr(0, fpos);
    std::string mid = s.substr(fpos + vlen, lpos - (fpos + vlen));
    std::string suf = s.substr(lpos + vlen);
    return pre + colors.border + V + sgr_reset() + mid + colors.border + V + sgr_reset() + suf;
  }
  return colors.muted + s + sgr_reset();
}

int detail_viewport_rows(int rows) {
  return std::max(5, rows - 15);
}

namespace {

// First visible index of a window of `height` rows that keeps `cursor` shown.
size_t window_start(size_t cursor, size_t count, size_t height) {
  if (count <= height || cursor < height) return 0;
  size_t start = cursor - height + 1;
  return std::min(start, count - height);
}

std::string cursor_mark(bool on) {
  if (!on) return "  ";
  return use_unicode() ? "▸ " : "> ";
}

std::string highlight(const std::string& s, bool on) {
  if (!on) return s;
  return config().colors.selected + sgr_reverse() + s + sgr_reset();
}

std::string help_text(const StateMachine& sm) {
  switch (sm.state()) {
    case State::Menu:
      return "↑/↓ move  Enter select  q quit";
    case State::Scanning:
      return "Scanning…  q quit";
    case State::Results:
      return "↑/↓ move  Enter open  c clean category  Esc menu  q quit";
    case State::Detail:
      return "↑/↓ PgUp/PgDn move  Enter open  Space mark  A all  N none  D delete marked  "
             "c delete  Backspace up  Esc menu  q quit";
    case State::Cleaning:
      return "Deleting…";
    case State::DiskUsageReport:
      return "↑/↓ PgUp/PgDn scroll  q/Esc back";
  }
  return {};
}

std::vector<std::string> menu_view(const StateMachine& sm) {
  const auto& colors = config().colors;
  std::vector<std::string> out;
  out.push_back(sgr_bold() + "Reclaim disk space" + sgr_reset());
  out.emplace_back();
  for (size_t i = 0; i < dustpan::app::kMenu.size(); ++i) {
    const auto& e = dustpan::app::kMenu[i];
    const bool sel = i == sm.menu_cursor();
    std::string title = trunc_pad(e.title, 20);
    std::string line = cursor_mark(sel) + highlight(title, sel);
    if (e.description[0]) line += "  " + colors.muted + e.description + sgr_reset();
    out.push_back(line);
  }
  if (!sm.error().empty()) {
    out.emplace_back();
    out.push_back(colors.warning + sgr_bold() + "Error: " + sm.error() + sgr_reset());
  }
  if (!sm.status().empty()) {
    out.emplace_back();
    out.push_back(sm.status());
  }
  return out;
}

std::vector<std::string> scanning_view(const StateMachine& sm, int iw) {
  const auto& colors = config().colors;
  const auto& v = sm.scan_view();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - v.started).count();
  std::vector<std::string> out;
  out.push_back(sgr_bold() + "Scanning (" + dustpan::probes::profile_name(v.profile) + ")" + sgr_reset() +
                "  " + std::to_string(v.probes) + " probes, " + std::to_string(secs) + "s");
  out.emplace_back();
  out.push_back("Found:   " + colors.accent + std::to_string(v.found) + " items" + sgr_reset() +
                " (" + human_bytes(v.bytes) + ")");
  out.push_back("Current: " + colors.muted + trunc_pad(v.current, std::max(0, iw - 10)) + sgr_reset());
  out.emplace_back();
  if (!v.recent.empty()) {
    out.push_back("Recently found:");
    for (auto it = v.recent.rbegin(); it != v.recent.rend(); ++it) out.push_back("  " + *it);
  }
  return out;
}

std::vector<std::string> results_view(const StateMachine& sm, int iw, int height) {
  const auto& colors = config().colors;
  const auto& snap = sm.model().snapshot();
  const int size_w = 10, count_w = 12;
  const int name_w = std::max(10, iw - size_w - count_w - 4);

  std::vector<std::string> out;
  out.push_back(sgr_bold() + "Scan results" + sgr_reset());
  out.emplace_back();

  std::vector<std::string> rows;
  for (const auto& [name, res] : snap.categories) {
    rows.push_back(trunc_pad(name, name_w) + rpad_trunc(std::to_string(res.items.size()) + " items", count_w) +
                   rpad_trunc(human_bytes(res.total), size_w));
  }
  rows.push_back(trunc_pad("Back to Menu", name_w + count_w + size_w));

  const int budget = std::max(3, height - 7);
  const size_t start = window_start(sm.results_cursor(), rows.size(), static_cast<size_t>(budget));
  const size_t end = std::min(rows.size(), start + static_cast<size_t>(budget));
  for (size_t i = start; i < end; ++i) {
    const bool sel = i == sm.results_cursor();
    if (i + 1 == rows.size()) out.push_back(std::string(use_unicode() ? "─" : "-"));
    out.push_back(cursor_mark(sel) + highlight(rows[i], sel));
  }
  out.emplace_back();
  out.push_back("  " + colors.accent + sgr_bold() + trunc_pad("TOTAL", name_w) +
                rpad_trunc(std::to_string(snap.item_count()) + " items", count_w) +
                rpad_trunc(human_bytes(snap.grand_total), size_w) + sgr_reset());
  if (!sm.status().empty()) {
    out.emplace_back();
    out.push_back(sm.status());
  }
  return out;
}

std::vector<std::string> detail_view(const StateMachine& sm, int iw, int rows) {
  const auto& colors = config().colors;
  const auto& m = sm.model();
  const bool uni = use_unicode();
  std::vector<std::string> out;

  std::string crumb;
  for (const auto& seg : m.breadcrumb()) {
    if (!crumb.empty()) crumb += uni ? " › " : " > ";
    crumb += seg;
  }
  out.push_back(sgr_bold() + crumb + sgr_reset() + (sm.explore_pending() ? colors.muted + "  loading…" + sgr_reset() : ""));
  out.emplace_back();

  const auto& items = m.listing();
  const size_t vp = static_cast<size_t>(detail_viewport_rows(rows));
  const int size_w = 10, age_w = 6;
  const int name_w = std::max(10, iw - size_w - age_w - 10);
  if (items.empty()) {
    out.push_back(colors.muted + "  (empty)" + sgr_reset());
  } else {
    const size_t start = window_start(m.cursor(), items.size(), vp);
    const size_t end = std::min(items.size(), start + vp);
    if (start > 0) out.push_back(colors.muted + "  ↑ " + std::to_string(start) + " more" + sgr_reset());
    for (size_t i = start; i < end; ++i) {
      const auto& it = items[i];
      const bool sel = i == m.cursor();
      const bool marked = m.is_marked(it.path);
      std::string box = uni ? (marked ? "☑" : "☐") : (marked ? "[x]" : "[ ]");
      std::string glyph = uni ? (it.is_dir ? "📁" : "📄") : (it.is_dir ? "d" : "-");
      std::string age = it.age_days ? dustpan::util::age_label(*it.age_days) : std::string();
      std::string row = box + " " + glyph + " " + trunc_pad(it.name, name_w) + rpad_trunc(age, age_w) +
                        rpad_trunc(human_bytes(it.size), size_w);
      if (marked && !sel) row = colors.caution + row + sgr_reset();
      out.push_back(cursor_mark(sel) + highlight(row, sel));
    }
    if (end < items.size())
      out.push_back(colors.muted + "  ↓ " + std::to_string(items.size() - end) + " more" + sgr_reset());
  }
  out.emplace_back();
  std::string footer = "Total: " + human_bytes(m.listing_total());
  if (!m.marks().empty())
    footer += std::string(uni ? " • " : " - ") + "Marked: " + std::to_string(m.marks().size()) + " items (" +
              human_bytes(m.marked_bytes()) + ")";
  out.push_back(footer);
  if (!sm.status().empty()) out.push_back(colors.accent + sm.status() + sgr_reset());
  return out;
}

std::vector<std::string> cleaning_view(const StateMachine& sm) {
  std::vector<std::string> out;
  out.push_back(config().colors.caution + sgr_bold() + sm.cleaning_label() + sgr_reset());
  out.emplace_back();
  out.push_back("Please wait…");
  return out;
}

std::vector<std::string> disk_view(const StateMachine& sm, int height) {
  const auto& colors = config().colors;
  const auto& rep = sm.disk_report();
  std::vector<std::string> out;
  if (sm.disk_loading()) {
    out.push_back("Running " + rep.command + "…");
    return out;
  }
  out.push_back(sgr_bold() + trunc_pad("Filesystem", 26) + rpad_trunc("Size", 8) + rpad_trunc("Used", 8) +
                rpad_trunc("Avail", 8) + rpad_trunc("Use%", 6) + "  Mounted on" + sgr_reset());
  const size_t budget = static_cast<size_t>(std::max(3, height - 4));
  const size_t start = std::min(sm.disk_scroll(), rep.rows.empty() ? size_t{0} : rep.rows.size() - 1);
  const size_t end = std::min(rep.rows.size(), start + budget);
  for (size_t i = start; i < end; ++i) {
    const auto& r = rep.rows[i];
    int pct = std::atoi(r.capacity.c_str());
    std::string cap = rpad_trunc(r.capacity, 6);
    if (pct >= 90) cap = colors.warning + cap + sgr_reset();
    else if (pct >= 75) cap = colors.caution + cap + sgr_reset();
    out.push_back(trunc_pad(r.filesystem, 26) + rpad_trunc(r.size, 8) + rpad_trunc(r.used, 8) +
                  rpad_trunc(r.avail, 8) + cap + "  " + r.mounted_on);
  }
  if (end < rep.rows.size())
    out.push_back(colors.muted + "  " + std::to_string(rep.rows.size() - end) + " more" + sgr_reset());
  return out;
}

const char* view_title(State s) {
  switch (s) {
    case State::Menu: return "dustpan";
    case State::Scanning: return "Scanning";
    case State::Results: return "Results";
    case State::Detail: return "Detail";
    case State::Cleaning: return "Cleaning";
    case State::DiskUsageReport: return "Disk Usage";
  }
  return "dustpan";
}

} // namespace

std::vector<std::string> render_lines(const StateMachine& sm, int cols, int rows) {
  cols = std::max(20, cols);
  rows = std::max(6, rows);
  const int iw = cols - 2;
  const int box_h = rows - 1;
  const int content_h = box_h - 2;

  std::vector<std::string> body;
  switch (sm.state()) {
    case State::Menu:            body = menu_view(sm); break;
    case State::Scanning:        body = scanning_view(sm, iw); break;
    case State::Results:         body = results_view(sm, iw, content_h); break;
    case State::Detail:          body = detail_view(sm, iw, rows); break;
    case State::Cleaning:        body = cleaning_view(sm); break;
    case State::DiskUsageReport: body = disk_view(sm, content_h); break;
  }
  if ((int)body.size() > content_h) body.resize(static_cast<size_t>(content_h));

  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(rows));
  out.push_back(trunc_pad(help_text(sm), cols));
  for (auto& l : make_box(view_title(sm.state()), body, cols, content_h)) out.push_back(std::move(l));
  return out;
}

void render_screen(const StateMachine& sm) {
  int cols = term_cols();
  int rows = term_rows();
  auto lines = render_lines(sm, cols, rows);
  std::string frame;
  frame.reserve((size_t)rows * (size_t)cols + 64);
  frame += "\x1B[H";
  for (size_t i = 0; i < lines.size(); ++i) {
    frame += colorize_line(lines[i]);
    if (i + 1 < lines.size()) frame += "\n";
  }
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace dustpan::ui
