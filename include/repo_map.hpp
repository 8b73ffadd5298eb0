#pragma once
#include <atomic>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "config.hpp"
#include "map_renderer.hpp"
#include "tag.hpp"
#include "tag_cache.hpp"
#include "token_counter.hpp"

namespace repomap {

namespace fs = std::filesystem;

struct MapRequest {
    std::string root;
    std::vector<std::string> chat_files;      // absolute or root-relative
    std::vector<std::string> other_files;
    std::vector<std::string> mentioned_files;
    std::set<std::string> mentioned_idents;
    std::optional<int> map_tokens;            // unset: config.map_tokens
    bool force_refresh = false;
    const std::atomic<bool>* cancel = nullptr; // polled between phases
};

struct MapStats {
    size_t files = 0;
    size_t tags = 0;
    size_t definitions = 0;
    size_t edges = 0;
    int iterations = 0;
    bool converged = false;
    size_t ranked_entries = 0;
    size_t selected_entries = 0;
    int budget = 0;
    int tokens = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    bool token_counter_degraded = false;
    bool cancelled = false;
};

struct MapResult {
    std::string text;
    MapStats stats;
};

class RepoMap {
public:
    // Throws ConfigError when `config` is invalid. Empty collaborators fall
    // back to the character token estimate and FileSystemTools::read_file_safe.
    explicit RepoMap(
        RepoMapConfig config = {},
        TokenCounter::CountFn token_counter = {},
        TextReader reader = {});

    // Throws RepoMapError only when the root is not an accessible directory.
    // Everything else degrades toward a smaller (possibly empty) map.
    MapResult get_repo_map(const MapRequest& request) const;

    const RepoMapConfig& config() const { return config_; }

    // 🚀 Pipeline phases, public for tests

    // Union of chat, mentioned and other files, each once, sorted by
    // rel_path. Role precedence: chat > mentioned > other. Missing files
    // are dropped with a warning.
    std::vector<FileRecord> collect_files(const fs::path& root, const MapRequest& request) const;

    // Fills tags, mtime and size of every record; parallel across files.
    void extract_tags(std::vector<FileRecord>& files, TagCache& cache, bool force_refresh) const;

    // Important files, then ranked definitions, then remaining files as
    // bare headers.
    std::vector<RankedTag> rank_tags(
        const std::vector<FileRecord>& files,
        const std::set<std::string>& mentioned_idents,
        MapStats* stats = nullptr) const;

    // Budget after the no-chat-files expansion.
    int effective_budget(int requested, bool has_chat_files) const;

    fs::path cache_directory(const fs::path& root) const;

private:
    RepoMapConfig config_;
    TokenCounter::CountFn token_counter_;
    TextReader reader_;
};

} // namespace repomap
