#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "probes/ICategoryProbe.hpp"

namespace dustpan::probes {

enum class ScanProfile {
  Broad,  // fixed set of well-known cache locations
  Quick,  // caches, logs and trash only
  Deep,   // developer ecosystems, including home-tree walks
};

[[nodiscard]] const char* profile_name(ScanProfile p);

// Everything the concrete probes need to know about the user's environment.
struct ProbeContext {
  std::string home;
  std::string gopath;       // empty: $home/go
  std::string cargo_home;   // empty: $home/.cargo
  std::string gem_home;     // empty: $home/.gem
  int download_age_days{30};
  uint64_t docker_min_bytes{100ull * 1024 * 1024};
  std::vector<std::string> extra_skip;
};

// Context for home, with GOPATH / CARGO_HOME / GEM_HOME taken from the environment.
[[nodiscard]] ProbeContext probe_context_from_env(std::string home);

using ProbeSet = std::vector<std::shared_ptr<const ICategoryProbe>>;

// The ordered, mutually independent probes for a profile.
[[nodiscard]] ProbeSet make_probes(ScanProfile profile, const ProbeContext& ctx);

// Individual categories
[[nodiscard]] std::shared_ptr<const ICategoryProbe> cache_files_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> log_files_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> trash_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> old_downloads_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> xcode_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> homebrew_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> node_modules_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> python_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> rust_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> build_artifacts_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> js_package_cache_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> go_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> jvm_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> ruby_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> docker_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> ide_cache_probe(const ProbeContext& ctx);
[[nodiscard]] std::shared_ptr<const ICategoryProbe> cocoapods_probe(const ProbeContext& ctx);

} // namespace dustpan::probes
