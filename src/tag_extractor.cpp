#include "tag_extractor.hpp"
#include "heuristic_tagger.hpp"
#include "parser_elite.hpp"
#include <spdlog/spdlog.h>

namespace repomap {

void ExtractorRegistry::register_extractor(std::unique_ptr<TagExtractor> extractor) {
    spdlog::debug("🛰️ Extractor registered: {}", extractor->name());
    extractors_.push_back(std::move(extractor));
}

void ExtractorRegistry::set_fallback(std::unique_ptr<TagExtractor> extractor) {
    fallback_ = std::move(extractor);
}

std::vector<Tag> ExtractorRegistry::extract(
    const std::string& rel_path,
    const std::string& abs_path,
    const std::string& content,
    const std::string& language)
{
    TagExtractor* chosen = nullptr;
    for (const auto& extractor : extractors_) {
        if (extractor->can_handle(rel_path, language)) {
            chosen = extractor.get();
            break;
        }
    }
    if (!chosen && fallback_ && fallback_->can_handle(rel_path, language)) {
        chosen = fallback_.get();
    }
    if (!chosen) return {};

    try {
        return chosen->extract(rel_path, abs_path, content, language);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ {} failed on {}: {}", chosen->name(), rel_path, e.what());
    }
    return {};
}

std::unique_ptr<ExtractorRegistry> ExtractorRegistry::with_defaults() {
    auto registry = std::make_unique<ExtractorRegistry>();
    registry->register_extractor(std::make_unique<elite::ASTTagger>());
    registry->set_fallback(std::make_unique<HeuristicTagger>());
    return registry;
}

} // namespace repomap
