#pragma once
#include <regex>
#include <string>
#include <vector>
#include "tag_extractor.hpp"

namespace repomap {

// Grammar-free fallback. Definitions are recognised by a leading keyword
// (def, class, fn, func, ...); their span follows the brace block or the
// indented block. Every other identifier outside strings and comments is a
// reference.
class HeuristicTagger : public TagExtractor {
public:
    HeuristicTagger();

    std::string name() const override { return "heuristic"; }
    bool can_handle(const std::string& path, const std::string& language) const override;
    std::vector<Tag> extract(
        const std::string& rel_path,
        const std::string& abs_path,
        const std::string& content,
        const std::string& language) override;

private:
    std::regex def_re_;

    static std::vector<std::string> clean_lines(const std::vector<std::string>& lines, const std::string& language);
    static int block_end(const std::vector<std::string>& cleaned, int def_line);
};

} // namespace repomap
