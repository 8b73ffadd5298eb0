#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace repomap {

enum class TagKind { Definition, Reference };

// Caller-assigned per invocation, never persisted.
enum class FileRole { Chat, Mentioned, Other };

struct Tag {
    std::string rel_path;
    std::string abs_path;
    std::string name;
    TagKind kind = TagKind::Reference;
    int line_start = 0; // 0-based
    int line_end = 0;   // inclusive

    bool is_definition() const { return kind == TagKind::Definition; }

    // Paths are not serialized; the cache entry key carries them.
    nlohmann::json to_json() const;
    static Tag from_json(const nlohmann::json& j, const std::string& rel_path, const std::string& abs_path);

    bool operator==(const Tag& other) const {
        return rel_path == other.rel_path && abs_path == other.abs_path && name == other.name &&
               kind == other.kind && line_start == other.line_start && line_end == other.line_end;
    }
    bool operator!=(const Tag& other) const { return !(*this == other); }
};

struct FileRecord {
    std::string path;     // absolute, lexically normal
    std::string rel_path; // relative to the repository root, '/' separated
    std::string language_hint;
    long long mtime = 0;
    std::uintmax_t size = 0;
    std::vector<Tag> tags;
    FileRole role = FileRole::Other;
};

struct RankedTag {
    Tag tag;
    double score = 0.0;
    // Set for entries that list a file without any definition (important
    // files, files without tags).
    bool header_only = false;
};

const char* to_string(TagKind kind);
const char* to_string(FileRole role);

// Maps a file name to a language name ("python", "cpp", ...). Empty when
// the file is not recognised as source code.
std::string detect_language(const std::string& path);

} // namespace repomap
