#pragma once
#include <tree_sitter/api.h>
#include <map>
#include <string>
#include <vector>
#include "tag_extractor.hpp"

// Grammars are linked from the installed tree-sitter grammar libraries.
extern "C" {
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
}

namespace repomap {
    namespace elite {

// tree-sitter backed extractor. Definitions come from per-language tag
// queries; every other identifier leaf in the tree is a reference.
// Owns one TSParser, so one instance per thread.
class ASTTagger : public TagExtractor {
public:
    ASTTagger();
    ~ASTTagger() override;

    ASTTagger(const ASTTagger&) = delete;
    ASTTagger& operator=(const ASTTagger&) = delete;

    std::string name() const override { return "tree-sitter"; }
    bool can_handle(const std::string& path, const std::string& language) const override;
    std::vector<Tag> extract(
        const std::string& rel_path,
        const std::string& abs_path,
        const std::string& content,
        const std::string& language) override;

private:
    struct Grammar {
        const TSLanguage* language = nullptr;
        TSQuery* query = nullptr;
    };

    TSParser* parser_;
    std::map<std::string, Grammar> grammars_;

    void load_grammar(const std::string& language, const TSLanguage* ts_language, const std::string& query_source);
};

    }
}
