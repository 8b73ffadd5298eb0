#include "tag_cache.hpp"
#include "tools/AtomicJournal.hpp"
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace repomap {

using json = nlohmann::json;

namespace {

// FNV-1a, stable across runs and platforms (std::hash is not).
std::string path_key(const std::string& path) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : path) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return buf;
}

} // namespace

std::optional<FileIdentity> FileIdentity::of(const fs::path& abs_path) {
    std::error_code ec;
    auto size = fs::file_size(abs_path, ec);
    if (ec) return std::nullopt;
    auto time = fs::last_write_time(abs_path, ec);
    if (ec) return std::nullopt;

    FileIdentity id;
    id.path = abs_path.string();
    id.size = size;
    id.mtime = (long long)time.time_since_epoch().count();
    return id;
}

std::unique_ptr<TagCache> TagCache::open(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    bool persistent = !ec && fs::is_directory(dir, ec);
    if (!persistent) {
        spdlog::warn("⚠️ Tag cache unavailable at {} ({}); running memory-only",
                     dir.string(), ec ? ec.message() : "not a directory");
    } else {
        spdlog::debug("Tag cache opened at {}", dir.string());
    }
    return std::unique_ptr<TagCache>(new TagCache(dir, persistent));
}

TagCache::TagCache(fs::path dir, bool persistent)
    : dir_(std::move(dir)), persistent_(persistent) {}

TagCache::~TagCache() {
    close();
}

void TagCache::close() {
    if (!open_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    memory_.clear();
    open_ = false;
    spdlog::debug("Tag cache closed: {} hits, {} misses, {} writes, {} errors",
                  stats_.hits.load(), stats_.misses.load(), stats_.writes.load(), stats_.errors.load());
}

fs::path TagCache::entry_path(const std::string& abs_path) const {
    return dir_ / (path_key(abs_path) + ".json");
}

std::optional<std::vector<Tag>> TagCache::read_entry(const FileIdentity& id, const std::string& rel_path) {
    fs::path p = entry_path(id.path);
    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;

    std::ifstream f(p);
    if (!f) {
        stats_.errors++;
        spdlog::debug("Cache entry unreadable: {}", p.string());
        return std::nullopt;
    }

    try {
        json j = json::parse(f);
        if (j.at("version").get<int>() != kFormatVersion) return std::nullopt;
        if (j.at("path").get<std::string>() != id.path) return std::nullopt;
        if (j.at("mtime").get<long long>() != id.mtime) return std::nullopt;
        if (j.at("size").get<std::uintmax_t>() != id.size) return std::nullopt;

        std::vector<Tag> tags;
        for (const auto& jt : j.at("tags")) {
            tags.push_back(Tag::from_json(jt, rel_path, id.path));
        }
        return tags;
    } catch (const json::exception& e) {
        stats_.errors++;
        spdlog::warn("⚠️ Corrupted cache entry {} ignored: {}", p.string(), e.what());
    }
    return std::nullopt;
}

std::optional<std::vector<Tag>> TagCache::lookup(const FileIdentity& id, const std::string& rel_path) {
    if (!open_) return std::nullopt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = memory_.find(id.path);
        if (it != memory_.end()) {
            if (it->second.mtime == id.mtime && it->second.size == id.size) {
                std::vector<Tag> tags = it->second.tags;
                for (auto& t : tags) t.rel_path = rel_path;
                return tags;
            }
            memory_.erase(it);
        }
    }

    if (!persistent_) return std::nullopt;

    auto tags = read_entry(id, rel_path);
    if (tags) {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[id.path] = MemoryEntry{id.mtime, id.size, *tags};
    }
    return tags;
}

void TagCache::store(const FileIdentity& id, const std::vector<Tag>& tags) {
    if (!open_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        memory_[id.path] = MemoryEntry{id.mtime, id.size, tags};
    }
    if (!persistent_) return;

    json j_tags = json::array();
    for (const auto& t : tags) j_tags.push_back(t.to_json());
    json entry = {
        {"version", kFormatVersion},
        {"path", id.path},
        {"mtime", id.mtime},
        {"size", id.size},
        {"tags", j_tags}
    };

    std::error_code ec;
    if (AtomicJournal::write(entry_path(id.path), entry.dump(), ec)) {
        stats_.writes++;
    } else {
        stats_.errors++;
        spdlog::warn("⚠️ Cache write failed for {}: {}", id.path, ec.message());
    }
}

std::vector<Tag> TagCache::get_tags(
    const FileIdentity& id,
    const std::string& rel_path,
    const ExtractFn& extract,
    bool force_refresh)
{
    if (!force_refresh) {
        if (auto cached = lookup(id, rel_path)) {
            stats_.hits++;
            spdlog::debug("CACHE HIT  | {}", rel_path);
            return *cached;
        }
    }

    stats_.misses++;
    spdlog::debug("CACHE MISS | {}{}", rel_path, force_refresh ? " (forced)" : "");
    auto tags = extract();
    if (!tags) return {};
    store(id, *tags);
    return *tags;
}

} // namespace repomap
