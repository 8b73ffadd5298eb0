#pragma once
#include <memory>
#include <string>
#include <vector>
#include "tag.hpp"

namespace repomap {

// One way of turning a file's text into tags. Implementations must be pure
// functions of their input: same text, same tags.
class TagExtractor {
public:
    virtual ~TagExtractor() = default;
    virtual std::string name() const = 0;
    virtual bool can_handle(const std::string& path, const std::string& language) const = 0;
    virtual std::vector<Tag> extract(
        const std::string& rel_path,
        const std::string& abs_path,
        const std::string& content,
        const std::string& language) = 0;
};

// Extractors tried in registration order; the fallback runs when none of
// them accepts the file. Not thread-safe: give each worker its own registry.
class ExtractorRegistry {
public:
    void register_extractor(std::unique_ptr<TagExtractor> extractor);
    void set_fallback(std::unique_ptr<TagExtractor> extractor);

    // Never throws for per-file problems; a failing extractor yields {}.
    std::vector<Tag> extract(
        const std::string& rel_path,
        const std::string& abs_path,
        const std::string& content,
        const std::string& language);

    size_t size() const { return extractors_.size(); }

    // tree-sitter grammars first, name-occurrence heuristic as fallback.
    static std::unique_ptr<ExtractorRegistry> with_defaults();

private:
    std::vector<std::unique_ptr<TagExtractor>> extractors_;
    std::unique_ptr<TagExtractor> fallback_;
};

} // namespace repomap
