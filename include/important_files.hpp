#pragma once
#include <string>
#include <vector>

namespace repomap {

// Well-known project files (README, build manifests, CI workflows) that
// orient a reader regardless of rank. `rel_path` is '/' separated.
bool is_important(const std::string& rel_path);

// Subset of `rel_paths` that is important, order preserved.
std::vector<std::string> filter_important_files(const std::vector<std::string>& rel_paths);

} // namespace repomap
