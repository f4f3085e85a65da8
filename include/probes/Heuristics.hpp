#pragma once
#include <string>
#include <vector>

namespace dustpan::probes {

// True for subtrees a home-tree walk must not enter: system and library
// locations, trash folders, VCS metadata, plus caller supplied fragments.
// Library paths under Documents or Desktop are still walked.
[[nodiscard]] bool should_skip_dir(const std::string& path,
                                   const std::vector<std::string>& extra_skip = {});

// True if dir holds a recognisable project manifest (package.json, Cargo.toml, ...).
[[nodiscard]] bool is_project_dir(const std::string& dir);

// dir relative to root for display; "~" when dir is root itself.
[[nodiscard]] std::string relative_label(const std::string& root, const std::string& dir);

} // namespace dustpan::probes
