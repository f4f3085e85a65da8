#include "probes/ProbeRegistry.hpp"
#include "probes/DirectoryProbe.hpp"
#include "probes/Heuristics.hpp"
#include "util/DirSize.hpp"

#include <cstdlib>
#include <initializer_list>
#include <set>

namespace dustpan::probes {

namespace {

std::string under(const std::string& base, std::initializer_list<const char*> parts) {
  std::string p = base;
  for (const char* part : parts) p = dustpan::util::join_path(p, part);
  return p;
}

std::string env_or(const char* name, const std::string& fallback) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : fallback;
}

std::shared_ptr<const ICategoryProbe> make(std::string category, std::vector<Location> locations,
                                           std::optional<TreeMatch> tree = std::nullopt) {
  return std::make_shared<DirectoryProbe>(std::move(category), std::move(locations), std::move(tree));
}

Location whole(std::string path, std::string label, uint64_t min_bytes = 1) {
  return Location{.path = std::move(path), .label = std::move(label), .min_bytes = min_bytes};
}

Location children(std::string path, std::string prefix = {}, uint64_t min_bytes = 1) {
  return Location{.path = std::move(path), .label = std::move(prefix),
                  .collect = Collect::Children, .min_bytes = min_bytes};
}

TreeMatch home_walk(const ProbeContext& ctx, std::string glyph, bool show_name,
                    std::function<bool(const std::string&, const std::string&)> matches) {
  return TreeMatch{.root = ctx.home, .matches = std::move(matches), .glyph = std::move(glyph),
                   .show_name = show_name, .extra_skip = ctx.extra_skip};
}

} // namespace

const char* profile_name(ScanProfile p) {
  switch (p) {
    case ScanProfile::Broad: return "full";
    case ScanProfile::Quick: return "quick";
    case ScanProfile::Deep:  return "dev";
  }
  return "?";
}

ProbeContext probe_context_from_env(std::string home) {
  ProbeContext ctx;
  ctx.home = std::move(home);
  ctx.gopath = env_or("GOPATH", {});
  ctx.cargo_home = env_or("CARGO_HOME", {});
  ctx.gem_home = env_or("GEM_HOME", {});
  return ctx;
}

std::shared_ptr<const ICategoryProbe> cache_files_probe(const ProbeContext& ctx) {
  // Homebrew has its own category; keep it out of the generic cache listing
  auto mac = children(under(ctx.home, {"Library", "Caches"}));
  mac.exclude_names = {"Homebrew"};
  auto xdg = children(under(ctx.home, {".cache"}));
  xdg.exclude_names = {"Homebrew"};
  return make("Cache Files", {mac, children("/Library/Caches"), xdg});
}

std::shared_ptr<const ICategoryProbe> log_files_probe(const ProbeContext& ctx) {
  auto logs = [](std::string path) {
    return Location{.path = std::move(path), .collect = Collect::MatchingFiles,
                    .min_bytes = 0, .name_contains = ".log"};
  };
  return make("Log Files", {logs(under(ctx.home, {"Library", "Logs"})), logs("/Library/Logs"),
                            logs("/var/log"), logs(under(ctx.home, {".local", "state"}))});
}

std::shared_ptr<const ICategoryProbe> trash_probe(const ProbeContext& ctx) {
  // The freedesktop trash keeps files/ and info/*.trashinfo in step, so it is
  // cleaned as one unit
  return make("Trash", {children(under(ctx.home, {".Trash"}), {}, 0),
                        whole(under(ctx.home, {".local", "share", "Trash"}), "Desktop Trash")});
}

std::shared_ptr<const ICategoryProbe> old_downloads_probe(const ProbeContext& ctx) {
  auto loc = children(under(ctx.home, {"Downloads"}), {}, 0);
  loc.older_than_days = ctx.download_age_days > 0 ? ctx.download_age_days : 30;
  return make("Old Downloads", {loc});
}

std::shared_ptr<const ICategoryProbe> xcode_probe(const ProbeContext& ctx) {
  return make("Xcode Files", {children(under(ctx.home, {"Library", "Developer", "Xcode", "DerivedData"}), "Xcode: "),
                              children(under(ctx.home, {"Library", "Developer", "Xcode", "Archives"}), "Xcode: "),
                              children(under(ctx.home, {"Library", "Developer", "CoreSimulator", "Devices"}), "Xcode: ")});
}

std::shared_ptr<const ICategoryProbe> homebrew_probe(const ProbeContext& ctx) {
  return make("Homebrew Cache", {children(under(ctx.home, {"Library", "Caches", "Homebrew"}), "Brew: "),
                                 children(under(ctx.home, {".cache", "Homebrew"}), "Brew: ")});
}

std::shared_ptr<const ICategoryProbe> node_modules_probe(const ProbeContext& ctx) {
  return make("Node Modules", {}, home_walk(ctx, "📦", false, [](const std::string& name, const std::string&) {
    return name == "node_modules";
  }));
}

std::shared_ptr<const ICategoryProbe> python_probe(const ProbeContext& ctx) {
  static const std::set<std::string, std::less<>> names = {
    "__pycache__", "venv", ".venv", "env", ".env", "virtualenv", ".pytest_cache", ".tox", ".mypy_cache",
  };
  return make("Python Artifacts",
              {whole(under(ctx.home, {".cache", "pip"}), "Python: pip cache"),
               whole(under(ctx.home, {"Library", "Caches", "pip"}), "Python: pip cache"),
               whole(under(ctx.home, {".conda", "pkgs"}), "Python: pkgs cache")},
              home_walk(ctx, "🐍", true, [](const std::string& name, const std::string&) {
                return names.contains(name);
              }));
}

std::shared_ptr<const ICategoryProbe> rust_probe(const ProbeContext& ctx) {
  std::string cargo = ctx.cargo_home.empty() ? under(ctx.home, {".cargo"}) : ctx.cargo_home;
  return make("Rust Artifacts", {whole(under(cargo, {"registry", "cache"}), "🦀 Cargo registry cache")},
              home_walk(ctx, "🦀", false, [](const std::string& name, const std::string& parent) {
                return name == "target" &&
                       dustpan::util::path_exists(dustpan::util::join_path(parent, "Cargo.toml"));
              }));
}

std::shared_ptr<const ICategoryProbe> build_artifacts_probe(const ProbeContext& ctx) {
  static const std::set<std::string, std::less<>> names = {
    "dist", "build", "out", ".next", ".nuxt", ".output", "coverage", ".nyc_output", ".parcel-cache", "tmp", "temp",
  };
  return make("Build Artifacts", {},
              home_walk(ctx, "🔨", true, [](const std::string& name, const std::string& parent) {
                return names.contains(name) && is_project_dir(parent);
              }));
}

std::shared_ptr<const ICategoryProbe> js_package_cache_probe(const ProbeContext& ctx) {
  return make("NPM/Yarn/PNPM Caches",
              {whole(under(ctx.home, {".npm"}), "NPM cache"),
               whole(under(ctx.home, {"Library", "Caches", "npm"}), "NPM cache (Library)"),
               whole(under(ctx.home, {".yarn", "cache"}), "Yarn cache"),
               whole(under(ctx.home, {".cache", "yarn"}), "Yarn cache (XDG)"),
               whole(under(ctx.home, {"Library", "Caches", "Yarn"}), "Yarn cache (Library)"),
               whole(under(ctx.home, {".pnpm-store"}), "PNPM store"),
               whole(under(ctx.home, {".local", "share", "pnpm", "store"}), "PNPM store (XDG)")});
}

std::shared_ptr<const ICategoryProbe> go_probe(const ProbeContext& ctx) {
  std::string gopath = ctx.gopath.empty() ? under(ctx.home, {"go"}) : ctx.gopath;
  return make("Go Artifacts", {whole(under(gopath, {"pkg", "mod"}), "Go: mod"),
                               whole(under(ctx.home, {".cache", "go-build"}), "Go: go-build"),
                               whole(under(ctx.home, {"Library", "Caches", "go-build"}), "Go: go-build")});
}

std::shared_ptr<const ICategoryProbe> jvm_probe(const ProbeContext& ctx) {
  return make("Java/JVM Artifacts", {whole(under(ctx.home, {".m2", "repository"}), "Maven: .m2 repository"),
                                     whole(under(ctx.home, {".gradle", "caches"}), "Gradle: caches")});
}

std::shared_ptr<const ICategoryProbe> ruby_probe(const ProbeContext& ctx) {
  std::string gems = ctx.gem_home.empty() ? under(ctx.home, {".gem"}) : ctx.gem_home;
  return make("Ruby Artifacts", {whole(gems, "Ruby: Gem cache"),
                                 whole(under(ctx.home, {".bundle", "cache"}), "Ruby: Bundler cache")});
}

std::shared_ptr<const ICategoryProbe> docker_probe(const ProbeContext& ctx) {
  uint64_t min = ctx.docker_min_bytes > 0 ? ctx.docker_min_bytes : 1;
  return make("Docker Artifacts",
              {whole(under(ctx.home, {"Library", "Containers", "com.docker.docker", "Data"}), "Docker: Desktop Data", min),
               whole(under(ctx.home, {".local", "share", "docker"}), "Docker: rootless data", min),
               whole(under(ctx.home, {".docker", "desktop"}), "Docker: Desktop Data", min)});
}

std::shared_ptr<const ICategoryProbe> ide_cache_probe(const ProbeContext& ctx) {
  return make("IDE Caches",
              {whole(under(ctx.home, {"Library", "Application Support", "Code", "Cache"}), "VS Code: Cache"),
               whole(under(ctx.home, {"Library", "Application Support", "Code", "CachedData"}), "VS Code: CachedData"),
               whole(under(ctx.home, {".config", "Code", "Cache"}), "VS Code: Cache"),
               whole(under(ctx.home, {".config", "Code", "CachedData"}), "VS Code: CachedData"),
               whole(under(ctx.home, {".vscode", "extensions"}), "VS Code: extensions"),
               children(under(ctx.home, {"Library", "Caches", "JetBrains"}), "JetBrains: "),
               children(under(ctx.home, {"Library", "Application Support", "JetBrains"}), "JetBrains: "),
               children(under(ctx.home, {".cache", "JetBrains"}), "JetBrains: ")});
}

std::shared_ptr<const ICategoryProbe> cocoapods_probe(const ProbeContext& ctx) {
  return make("CocoaPods", {whole(under(ctx.home, {"Library", "Caches", "CocoaPods"}), "CocoaPods cache")});
}

ProbeSet make_probes(ScanProfile profile, const ProbeContext& ctx) {
  switch (profile) {
    case ScanProfile::Broad:
      return {cache_files_probe(ctx), log_files_probe(ctx), trash_probe(ctx),
              old_downloads_probe(ctx), xcode_probe(ctx), homebrew_probe(ctx)};
    case ScanProfile::Quick:
      return {cache_files_probe(ctx), trash_probe(ctx), log_files_probe(ctx)};
    case ScanProfile::Deep:
      return {node_modules_probe(ctx), python_probe(ctx), rust_probe(ctx), build_artifacts_probe(ctx),
              js_package_cache_probe(ctx), go_probe(ctx), jvm_probe(ctx), ruby_probe(ctx),
              docker_probe(ctx), ide_cache_probe(ctx), xcode_probe(ctx), homebrew_probe(ctx),
              cocoapods_probe(ctx)};
  }
  return {};
}

} // namespace dustpan::probes
