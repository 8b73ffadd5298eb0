#include "map_renderer.hpp"
#include <algorithm>
#include <set>
#include <sstream>

namespace repomap {

namespace {

const char* kShown = "│";
const char* kElided = "⋮";

struct FileGroup {
    std::string rel_path;
    double max_score = 0.0;
    std::vector<const Tag*> tags;
};

} // namespace

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    // Continuation bytes at the cut: back up to the lead byte
    size_t end = length;
    while (end > 0 && (static_cast<unsigned char>(str[end]) & 0xC0) == 0x80) --end;
    return str.substr(0, end);
}

MapRenderer::MapRenderer(const std::vector<FileRecord>& files, TextReader reader, RenderOptions options)
    : reader_(std::move(reader)), options_(options) {
    for (const auto& f : files) files_[f.rel_path] = &f;
}

const std::vector<std::string>* MapRenderer::lines_of(const std::string& rel_path) const {
    auto cached = line_cache_.find(rel_path);
    if (cached != line_cache_.end()) return cached->second ? &*cached->second : nullptr;

    std::optional<std::vector<std::string>> lines;
    auto f = files_.find(rel_path);
    if (f != files_.end() && reader_) {
        if (auto text = reader_(f->second->path)) {
            lines.emplace();
            std::istringstream stream(*text);
            std::string line;
            while (std::getline(stream, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                lines->push_back(std::move(line));
            }
        }
    }
    auto& slot = line_cache_[rel_path];
    slot = std::move(lines);
    return slot ? &*slot : nullptr;
}

std::string MapRenderer::render_body(const std::string& rel_path, const std::vector<const Tag*>& tags) const {
    std::string out;
    const auto* lines = lines_of(rel_path);
    if (!lines) {
        // Source vanished since extraction: names are all we have.
        for (const Tag* t : tags) out += std::string(kShown) + t->name + "\n";
        return out;
    }

    const int total = static_cast<int>(lines->size());
    std::set<int> lois;
    auto f = files_.find(rel_path);

    for (const Tag* t : tags) {
        if (t->line_start < 0 || t->line_start >= total) continue;
        lois.insert(t->line_start);
        if (f == files_.end()) continue;
        for (const auto& d : f->second->tags) {
            if (!d.is_definition()) continue;
            if (d.line_start < t->line_start && d.line_end >= t->line_end && d.line_start >= 0) {
                lois.insert(d.line_start);
            }
        }
    }
    if (lois.empty()) return out;

    auto emit = [&](int row) {
        out += kShown;
        out += utf8_safe_substr((*lines)[row], static_cast<size_t>(options_.max_line_length));
        out += "\n";
    };

    if (*lois.begin() > 0) out += std::string(kElided) + "\n";
    int prev = -1;
    for (int row : lois) {
        if (prev >= 0) {
            if (row - prev - 1 <= options_.merge_gap) {
                for (int fill = prev + 1; fill < row; ++fill) emit(fill);
            } else {
                out += std::string(kElided) + "\n";
            }
        }
        emit(row);
        prev = row;
    }
    if (prev < total - 1) out += std::string(kElided) + "\n";
    return out;
}

std::string MapRenderer::render(
    const std::vector<RankedTag>& ranked,
    size_t count,
    const std::vector<std::string>& chat_rel_paths) const
{
    std::set<std::string> chat(chat_rel_paths.begin(), chat_rel_paths.end());

    std::vector<FileGroup> groups;
    std::map<std::string, size_t> group_of;
    const size_t limit = std::min(count, ranked.size());

    for (size_t i = 0; i < limit; ++i) {
        const auto& entry = ranked[i];
        const std::string& rel = entry.tag.rel_path;
        if (chat.count(rel)) continue;

        auto it = group_of.find(rel);
        if (it == group_of.end()) {
            it = group_of.emplace(rel, groups.size()).first;
            groups.push_back({rel, entry.score, {}});
        }
        FileGroup& g = groups[it->second];
        g.max_score = std::max(g.max_score, entry.score);
        if (!entry.header_only) g.tags.push_back(&entry.tag);
    }

    std::sort(groups.begin(), groups.end(), [](const FileGroup& a, const FileGroup& b) {
        if (a.max_score != b.max_score) return a.max_score > b.max_score;
        return a.rel_path < b.rel_path;
    });

    std::string out;
    for (const auto& rel : chat) out += "\n" + rel + ":\n";
    for (const auto& g : groups) {
        out += "\n" + g.rel_path + ":\n";
        if (!g.tags.empty()) out += render_body(g.rel_path, g.tags);
    }
    return out;
}

} // namespace repomap
