#include "minitest.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <string>

using dustpan::app::Key;
using dustpan::ui::Config;

static std::vector<Key> decode(const std::string& bytes, const Config& cfg) {
  return dustpan::ui::decode_keys(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), cfg);
}

TEST(config_defaults) {
  ::unsetenv("DUSTPAN_DOWNLOADS_AGE_DAYS");
  ::unsetenv("DUSTPAN_DF_COMMAND");
  ::unsetenv("DUSTPAN_EXTRA_SKIP");
  auto c = dustpan::ui::build_config(nullptr);
  ASSERT_EQ(c.scan.downloads_age_days, 30);
  ASSERT_EQ(c.disk.command, std::string("df -h"));
  ASSERT_TRUE(c.scan.extra_skip.empty());
  ASSERT_TRUE(c.keybinds.at('q') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at(' ') == Config::Action::MARK);
  ASSERT_TRUE(c.keybinds.at('A') == Config::Action::MARK_ALL);
  ASSERT_TRUE(c.keybinds.at('D') == Config::Action::DELETE_MARKED);
  // Destructive and bulk bindings need Shift; the lowercase letters stay unbound
  ASSERT_TRUE(!c.keybinds.contains('a'));
  ASSERT_TRUE(!c.keybinds.contains('d'));
  ASSERT_TRUE(!c.keybinds.contains('n'));
  ASSERT_TRUE(!c.keybinds.contains('C'));
  ASSERT_TRUE(c.keybinds.at('c') == Config::Action::DELETE_SELECTED);
  ASSERT_TRUE(c.keybinds.at(0x03) == Config::Action::QUIT);
}

TEST(config_toml_overrides_env) {
  ::setenv("DUSTPAN_DF_COMMAND", "df -k", 1);
  dustpan::util::TomlReader tr;
  tr.load_string("[disk]\ncommand = \"df -hl\"\n[scan]\ndownloads_age_days = 7\ndocker_min_mb = 250\n");
  auto c = dustpan::ui::build_config(&tr);
  ASSERT_EQ(c.disk.command, std::string("df -hl"));
  ASSERT_EQ(c.scan.downloads_age_days, 7);
  ASSERT_EQ(c.scan.docker_min_mb, 250);
  ::unsetenv("DUSTPAN_DF_COMMAND");
}

TEST(config_env_used_without_toml_key) {
  ::setenv("DUSTPAN_DF_COMMAND", "df -k", 1);
  ::setenv("DUSTPAN_EXTRA_SKIP", "/mnt/,/media/", 1);
  ::setenv("DUSTPAN_LOG", "0", 1);
  auto c = dustpan::ui::build_config(nullptr);
  ASSERT_EQ(c.disk.command, std::string("df -k"));
  ASSERT_EQ(c.scan.extra_skip.size(), 2u);
  ASSERT_TRUE(!c.log.enabled);
  ::unsetenv("DUSTPAN_DF_COMMAND");
  ::unsetenv("DUSTPAN_EXTRA_SKIP");
  ::unsetenv("DUSTPAN_LOG");
}

TEST(config_invalid_age_falls_back) {
  dustpan::util::TomlReader tr;
  tr.load_string("[scan]\ndownloads_age_days = 0\n");
  ASSERT_EQ(dustpan::ui::build_config(&tr).scan.downloads_age_days, 30);
}

TEST(config_keybind_override) {
  dustpan::util::TomlReader tr;
  tr.load_string("[keybinds]\nquit = \"x\"\ndelete_selected = \"X\"\n");
  auto c = dustpan::ui::build_config(&tr);
  ASSERT_TRUE(c.keybinds.at('x') == Config::Action::QUIT);
  ASSERT_TRUE(c.keybinds.at('X') == Config::Action::DELETE_SELECTED);
  ASSERT_TRUE(c.keybinds.find('q') == c.keybinds.end());
}

TEST(config_log_dir_prefers_config) {
  Config c{};
  c.log.dir = "/tmp/dustpan_custom_logs";
  ASSERT_EQ(dustpan::ui::log_dir(c), std::filesystem::path("/tmp/dustpan_custom_logs"));
  c.log.dir.clear();
  ::setenv("DUSTPAN_LOG_DIR", "/tmp/dustpan_env_logs", 1);
  ASSERT_EQ(dustpan::ui::log_dir(c), std::filesystem::path("/tmp/dustpan_env_logs"));
  ::unsetenv("DUSTPAN_LOG_DIR");
}

TEST(parse_hex_rgb_accepts_only_full_hex) {
  int r = 0, g = 0, b = 0;
  ASSERT_TRUE(dustpan::ui::parse_hex_rgb("#FF8000", r, g, b));
  ASSERT_EQ(r, 255);
  ASSERT_EQ(g, 128);
  ASSERT_EQ(b, 0);
  ASSERT_TRUE(!dustpan::ui::parse_hex_rgb("FF8000", r, g, b));
  ASSERT_TRUE(!dustpan::ui::parse_hex_rgb("#GG0000", r, g, b));
}

TEST(input_decodes_escape_sequences) {
  auto c = dustpan::ui::build_config(nullptr);
  auto keys = decode("\x1B[A\x1B[B\x1BOA\x1B[5~\x1B[6~\x1B[3~", c);
  ASSERT_EQ(keys.size(), 6u);
  ASSERT_TRUE(keys[0] == Key::Up);
  ASSERT_TRUE(keys[1] == Key::Down);
  ASSERT_TRUE(keys[2] == Key::Up);
  ASSERT_TRUE(keys[3] == Key::PageUp);
  ASSERT_TRUE(keys[4] == Key::PageDown);
  ASSERT_TRUE(keys[5] == Key::Backspace);
}

TEST(input_lone_escape_and_plain_keys) {
  auto c = dustpan::ui::build_config(nullptr);
  auto keys = decode(std::string("\x1B") + "\r\x7F jkADNcq", c);
  ASSERT_EQ(keys.size(), 11u);
  ASSERT_TRUE(keys[0] == Key::Escape);
  ASSERT_TRUE(keys[1] == Key::Enter);
  ASSERT_TRUE(keys[2] == Key::Backspace);
  ASSERT_TRUE(keys[3] == Key::Space);
  ASSERT_TRUE(keys[4] == Key::Down);
  ASSERT_TRUE(keys[5] == Key::Up);
  ASSERT_TRUE(keys[6] == Key::MarkAll);
  ASSERT_TRUE(keys[7] == Key::DeleteMarked);
  ASSERT_TRUE(keys[8] == Key::ClearMarks);
  ASSERT_TRUE(keys[9] == Key::DeleteSelected);
  ASSERT_TRUE(keys[10] == Key::Quit);
}

TEST(input_lowercase_bulk_keys_do_nothing) {
  auto c = dustpan::ui::build_config(nullptr);
  ASSERT_TRUE(decode("adnC", c).empty());
  auto keys = decode("dD", c);
  ASSERT_EQ(keys.size(), 1u);
  ASSERT_TRUE(keys[0] == Key::DeleteMarked);
}

TEST(input_ignores_unbound_bytes) {
  auto c = dustpan::ui::build_config(nullptr);
  ASSERT_TRUE(decode("z9!", c).empty());
  ASSERT_TRUE(decode("\x1B[C", c).empty());
}
