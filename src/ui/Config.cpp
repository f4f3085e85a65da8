#include "ui/Config.hpp"
#include "ui/Terminal.hpp"
#include "util/TomlReader.hpp"
#include <cctype>
#include <cstdlib>
#include <string>

namespace dustpan::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v1=hexv(hex[1]), v2=hexv(hex[2]), v3=hexv(hex[3]), v4=hexv(hex[4]), v5=hexv(hex[5]), v6=hexv(hex[6]);
  if (v1<0||v2<0||v3<0||v4<0||v5<0||v6<0) return false;
  r = v1*16+v2; g = v3*16+v4; b = v5*16+v6;
  return true;
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string n(name);
  std::string alt;
  if (n.rfind("DUSTPAN_", 0) == 0) alt = std::string("dustpan_") + n.substr(8);
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/dustpan/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/dustpan/config.toml";
  return {};
}

std::filesystem::path log_dir(const Config& c) {
  if (!c.log.dir.empty()) return c.log.dir;
  if (const char* v = getenv_compat("DUSTPAN_LOG_DIR")) return v;
  if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg)
    return std::filesystem::path(xdg) / "dustpan";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::filesystem::path(home) / ".local" / "state" / "dustpan";
  return {};
}

// Resolve a color role from TOML -> compiled default.
// TOML value can be integer (palette index) or "#RRGGBB".
static std::string resolve_color(const dustpan::util::TomlReader* toml, const char* role,
                                 int def_palette_idx, const char* def_hex) {
  if (toml && toml->has("roles", role)) {
    std::string val = toml->get_string("roles", role);
    if (!val.empty() && (std::isdigit(static_cast<unsigned char>(val[0])) || val[0]=='-')) {
      return sgr_palette_idx(toml->get_int("roles", role, def_palette_idx));
    }
    int r, g, b;
    if (parse_hex_rgb(val, r, g, b)) return sgr_truecolor(r, g, b);
  }
  if (def_hex) {
    int r, g, b;
    if (parse_hex_rgb(def_hex, r, g, b)) return sgr_truecolor(r, g, b);
  }
  return sgr_palette_idx(def_palette_idx);
}

static int resolve_int(const dustpan::util::TomlReader* toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml && toml->has(section, key)) return toml->get_int(section, key, def);
  if (env_name) return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const dustpan::util::TomlReader* toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml && toml->has(section, key)) return toml->get_bool(section, key, def);
  if (env_name) return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const dustpan::util::TomlReader* toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml && toml->has(section, key)) return toml->get_string(section, key, def);
  if (env_name) {
    if (const char* v = getenv_compat(env_name)) return std::string(v);
  }
  return def;
}

static std::vector<std::string> resolve_list(const dustpan::util::TomlReader* toml, const char* section,
                                             const char* key, const char* env_name) {
  if (toml && toml->has(section, key)) return toml->get_list(section, key);
  std::vector<std::string> out;
  const char* v = env_name ? getenv_compat(env_name) : nullptr;
  if (!v) return out;
  std::string s(v);
  size_t start = 0;
  while (start <= s.size()) {
    size_t comma = s.find(',', start);
    std::string item = s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    if (!item.empty()) out.push_back(item);
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

// Default keybind table
struct KeybindDef { const char* name; char key; Config::Action action; };
static constexpr KeybindDef default_keybinds[] = {
  {"quit",            'q', Config::Action::QUIT},
  {"mark",            ' ', Config::Action::MARK},
  {"mark_all",        'A', Config::Action::MARK_ALL},
  {"clear_marks",     'N', Config::Action::CLEAR_MARKS},
  {"delete_marked",   'D', Config::Action::DELETE_MARKED},
  {"delete_selected", 'c', Config::Action::DELETE_SELECTED},
  {"up",              'k', Config::Action::UP},
  {"down",            'j', Config::Action::DOWN},
};

static char bound_key(const dustpan::util::TomlReader* toml, const KeybindDef& kb) {
  if (toml && toml->has("keybinds", kb.name)) {
    std::string val = toml->get_string("keybinds", kb.name);
    if (!val.empty()) return val[0];
  }
  return kb.key;
}

static void populate_keybinds(Config& c, const dustpan::util::TomlReader* toml) {
  for (const auto& kb : default_keybinds) c.keybinds[bound_key(toml, kb)] = kb.action;
  // Ctrl+C quits even when ISIG is off
  c.keybinds[0x03] = Config::Action::QUIT;
}

Config build_config(const dustpan::util::TomlReader* toml) {
  Config c{};

  // --- [roles] ---
  c.colors.accent   = resolve_color(toml, "accent",   14, nullptr);
  c.colors.caution  = resolve_color(toml, "caution",  11, nullptr);
  c.colors.warning  = resolve_color(toml, "warning",   9, nullptr);
  c.colors.muted    = resolve_color(toml, "muted",    -1, "#787878");
  c.colors.border   = resolve_color(toml, "border",   -1, "#585858");
  c.colors.selected = resolve_color(toml, "selected", 10, nullptr);

  // --- [ui] ---
  c.ui.alt_screen = resolve_bool(toml, "ui", "alt_screen", "DUSTPAN_ALT_SCREEN", true);

  // --- [scan] ---
  c.scan.downloads_age_days = resolve_int(toml, "scan", "downloads_age_days", "DUSTPAN_DOWNLOADS_AGE_DAYS", 30);
  if (c.scan.downloads_age_days < 1) c.scan.downloads_age_days = 30;
  c.scan.docker_min_mb = resolve_int(toml, "scan", "docker_min_mb", "DUSTPAN_DOCKER_MIN_MB", 100);
  if (c.scan.docker_min_mb < 0) c.scan.docker_min_mb = 0;
  c.scan.extra_skip = resolve_list(toml, "scan", "extra_skip", "DUSTPAN_EXTRA_SKIP");

  // --- [disk] ---
  c.disk.command = resolve_string(toml, "disk", "command", "DUSTPAN_DF_COMMAND", "df -h");

  // --- [log] ---
  c.log.enabled = resolve_bool(toml, "log", "enabled", "DUSTPAN_LOG", true);
  c.log.dir     = resolve_string(toml, "log", "dir", nullptr, "");

  // --- [keybinds] ---
  populate_keybinds(c, toml);
  return c;
}

const Config& config() {
  static Config cfg = []{
    dustpan::util::TomlReader toml;
    auto path = config_file_path();
    bool have_toml = !path.empty() && toml.load(path);
    return build_config(have_toml ? &toml : nullptr);
  }();
  return cfg;
}

} // namespace dustpan::ui
