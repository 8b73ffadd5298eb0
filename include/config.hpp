#pragma once
#include <cstdint>
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace repomap {

struct RepoMapConfig {
    // Selection
    int map_tokens = 1024;
    int map_mul_no_files = 8;
    int max_context_window = 0; // 0 = unknown

    // Ranking
    double damping = 0.85;
    double tolerance = 1e-6;
    int max_iterations = 100;
    double chat_weight = 100.0;
    double mentioned_weight = 10.0;
    double other_weight = 1.0;
    double mentioned_ident_boost = 10.0;
    double chat_reference_boost = 50.0;

    // Rendering
    int merge_gap = 2;
    int max_line_length = 100;

    // Extraction
    std::uintmax_t max_file_bytes = 1024 * 1024;
    int extract_threads = 0; // 0 = OpenMP default
    std::string cache_dir;   // empty = <root>/.repomap.tags.cache.v1
    bool sample_token_count = false;

    // Throws ConfigError on out-of-range values.
    void validate() const;

    // Effective settings, logged by the CLI in verbose mode.
    nlohmann::json to_json() const;
    static RepoMapConfig from_json(const nlohmann::json& j);
};

// Looks for <root>/.repomap/config.json, then <root>/repomap.json. A
// missing file yields defaults and unparsable JSON is logged and ignored.
// Out-of-range or mistyped values throw ConfigError.
RepoMapConfig load_config(const std::filesystem::path& root);

// Explicit config path: any problem is a ConfigError.
RepoMapConfig load_config_file(const std::filesystem::path& config_path);

} // namespace repomap
