#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "tag.hpp"

namespace repomap {

namespace fs = std::filesystem;

struct FileIdentity {
    std::string path; // absolute
    long long mtime = 0;
    std::uintmax_t size = 0;

    bool operator==(const FileIdentity& o) const {
        return path == o.path && mtime == o.mtime && size == o.size;
    }

    // std::nullopt when the file cannot be stat'ed
    static std::optional<FileIdentity> of(const fs::path& abs_path);
};

// Persistent tag store keyed by (path, mtime, size). One JSON document per
// file, replaced atomically; an in-memory layer serves repeated lookups
// within one invocation. Safe to share between extraction workers.
class TagCache {
public:
    static constexpr int kFormatVersion = 1;

    // Never throws. If `dir` cannot be created the cache is memory-only.
    static std::unique_ptr<TagCache> open(const fs::path& dir);

    ~TagCache();
    TagCache(const TagCache&) = delete;
    TagCache& operator=(const TagCache&) = delete;

    void close();
    bool is_open() const { return open_; }
    bool persistent() const { return persistent_; }
    const fs::path& directory() const { return dir_; }

    // Fresh entry for `id` or std::nullopt. Tags come back with `rel_path`
    // as their relative path.
    std::optional<std::vector<Tag>> lookup(const FileIdentity& id, const std::string& rel_path);

    // Failures are logged and otherwise ignored.
    void store(const FileIdentity& id, const std::vector<Tag>& tags);

    // std::nullopt from the extractor means "could not read": nothing is
    // stored and the result is empty.
    using ExtractFn = std::function<std::optional<std::vector<Tag>>()>;

    // Cached tags when fresh; otherwise runs `extract` and overwrites the
    // entry. `force_refresh` skips the lookup.
    std::vector<Tag> get_tags(
        const FileIdentity& id,
        const std::string& rel_path,
        const ExtractFn& extract,
        bool force_refresh = false);

    struct Stats {
        std::atomic<size_t> hits{0};
        std::atomic<size_t> misses{0};
        std::atomic<size_t> writes{0};
        std::atomic<size_t> errors{0};
    };
    const Stats& stats() const { return stats_; }

    fs::path entry_path(const std::string& abs_path) const;

private:
    TagCache(fs::path dir, bool persistent);

    struct MemoryEntry {
        long long mtime;
        std::uintmax_t size;
        std::vector<Tag> tags;
    };

    fs::path dir_;
    bool persistent_;
    bool open_ = true;
    Stats stats_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MemoryEntry> memory_;

    std::optional<std::vector<Tag>> read_entry(const FileIdentity& id, const std::string& rel_path);
};

} // namespace repomap
