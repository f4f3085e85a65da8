#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace dustpan::util { class TomlReader; }

namespace dustpan::ui {

struct Config {
  enum class Action {
    QUIT, MARK, MARK_ALL, CLEAR_MARKS, DELETE_MARKED, DELETE_SELECTED, UP, DOWN,
  };

  struct Colors {
    std::string accent;
    std::string caution;
    std::string warning;
    std::string muted;
    std::string border;
    std::string selected;
  } colors;

  struct Ui {
    bool alt_screen{true};
  } ui;

  struct Scan {
    int downloads_age_days{30};
    int docker_min_mb{100};
    std::vector<std::string> extra_skip;
  } scan;

  struct Disk {
    std::string command{"df -h"};
  } disk;

  struct Log {
    bool enabled{true};
    std::string dir;
  } log;

  std::unordered_map<char, Action> keybinds;
};

// Process-wide configuration, resolved once: TOML file -> env -> default.
const Config& config();

// Resolve a configuration from an already loaded TOML document (or none).
[[nodiscard]] Config build_config(const dustpan::util::TomlReader* toml);

// $XDG_CONFIG_HOME/dustpan/config.toml or ~/.config/dustpan/config.toml
[[nodiscard]] std::string config_file_path();

// [log] dir, DUSTPAN_LOG_DIR, $XDG_STATE_HOME/dustpan or ~/.local/state/dustpan
[[nodiscard]] std::filesystem::path log_dir(const Config& c);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);

} // namespace dustpan::ui
