#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "tag.hpp"

namespace repomap {

// Returns a file's text, std::nullopt when unreadable.
using TextReader = std::function<std::optional<std::string>(const std::string& abs_path)>;

// Cuts at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

struct RenderOptions {
    int merge_gap = 2;        // hidden lines filled in instead of elided
    int max_line_length = 100;
};

// Renders a prefix of the ranked list as
//
//   <path>:
//   ⋮
//   │class Foo:
//   ⋮
//   │    def bar(self):
//   ⋮
//
// Chat files come first as bare headers, then files by descending best
// score (ties by path). Each shown definition pulls in the first line of
// every definition enclosing it.
class MapRenderer {
public:
    MapRenderer(const std::vector<FileRecord>& files, TextReader reader, RenderOptions options = {});

    std::string render(
        const std::vector<RankedTag>& ranked,
        size_t count,
        const std::vector<std::string>& chat_rel_paths) const;

private:
    std::map<std::string, const FileRecord*> files_;
    TextReader reader_;
    RenderOptions options_;
    mutable std::map<std::string, std::optional<std::vector<std::string>>> line_cache_;

    const std::vector<std::string>* lines_of(const std::string& rel_path) const;
    std::string render_body(const std::string& rel_path, const std::vector<const Tag*>& tags) const;
};

} // namespace repomap
