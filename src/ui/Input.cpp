#include "ui/Input.hpp"
#include <unistd.h>

namespace dustpan::ui {

using dustpan::app::Key;

static bool map_action(Config::Action a, Key& out) {
  switch (a) {
    case Config::Action::QUIT:            out = Key::Quit; return true;
    case Config::Action::MARK:            out = Key::Space; return true;
    case Config::Action::MARK_ALL:        out = Key::MarkAll; return true;
    case Config::Action::CLEAR_MARKS:     out = Key::ClearMarks; return true;
    case Config::Action::DELETE_MARKED:   out = Key::DeleteMarked; return true;
    case Config::Action::DELETE_SELECTED: out = Key::DeleteSelected; return true;
    case Config::Action::UP:              out = Key::Up; return true;
    case Config::Action::DOWN:            out = Key::Down; return true;
  }
  return false;
}

std::vector<Key> decode_keys(const unsigned char* buf, size_t n, const Config& cfg) {
  std::vector<Key> keys;
  size_t k = 0;
  while (k < n) {
    unsigned char c = buf[k++];
    if (c == 0x1B) {
      // ESC [ x, ESC O x (application cursor mode), or a bare ESC
      if (k >= n || (buf[k] != '[' && buf[k] != 'O')) { keys.push_back(Key::Escape); continue; }
      ++k;
      if (k >= n) break;
      unsigned char b = buf[k++];
      if (b == 'A') keys.push_back(Key::Up);
      else if (b == 'B') keys.push_back(Key::Down);
      else if (b == '5' || b == '6' || b == '3') {
        if (k < n && buf[k] == '~') {
          ++k;
          keys.push_back(b == '5' ? Key::PageUp : b == '6' ? Key::PageDown : Key::Backspace);
        }
      }
      continue;
    }
    if (c == '\r' || c == '\n') { keys.push_back(Key::Enter); continue; }
    if (c == 0x7F || c == 0x08) { keys.push_back(Key::Backspace); continue; }
    auto it = cfg.keybinds.find(static_cast<char>(c));
    Key key;
    if (it != cfg.keybinds.end() && map_action(it->second, key)) keys.push_back(key);
  }
  return keys;
}

std::vector<Key> read_keys(const Config& cfg) {
  unsigned char buf[64];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return decode_keys(buf, static_cast<size_t>(n), cfg);
}

} // namespace dustpan::ui
