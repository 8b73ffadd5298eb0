#include "code_graph.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace repomap {

size_t RelevanceGraph::add_node(const std::string& rel_path, FileRole role) {
    auto it = index_.find(rel_path);
    if (it != index_.end()) return it->second;

    size_t id = nodes_.size();
    nodes_.push_back({rel_path, role});
    out_weight_.push_back(0.0);
    index_[rel_path] = id;
    return id;
}

void RelevanceGraph::add_edge(size_t from, size_t to, const std::string& ident, double weight) {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw std::invalid_argument("edge endpoint out of range for '" + ident + "'");
    }
    if (!(weight > 0.0)) {
        throw std::invalid_argument("edge weight must be positive for '" + ident + "'");
    }
    edges_.push_back({from, to, ident, weight});
    if (from != to) out_weight_[from] += weight;
}

std::optional<size_t> RelevanceGraph::node_index(const std::string& rel_path) const {
    auto it = index_.find(rel_path);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

double specialness(
    const std::string& ident,
    size_t num_definers,
    bool mentioned,
    const RepoMapConfig& config)
{
    bool has_alpha = std::any_of(ident.begin(), ident.end(), [](unsigned char c) { return std::isalpha(c); });
    bool has_upper = std::any_of(ident.begin(), ident.end(), [](unsigned char c) { return std::isupper(c); });
    bool has_lower = std::any_of(ident.begin(), ident.end(), [](unsigned char c) { return std::islower(c); });

    bool is_snake = ident.find('_') != std::string::npos && has_alpha;
    bool is_kebab = ident.find('-') != std::string::npos && has_alpha;
    bool is_camel = has_upper && has_lower;

    double mul = 1.0;
    if (mentioned) mul *= config.mentioned_ident_boost;
    if ((is_snake || is_kebab || is_camel) && ident.size() >= 8) mul *= 10.0;
    if (!ident.empty() && ident[0] == '_') mul *= 0.1;
    if (num_definers > 5) mul *= 0.1;
    return mul;
}

RelevanceGraph GraphBuilder::build(
    const std::vector<FileRecord>& files,
    const std::set<std::string>& mentioned_idents) const
{
    RelevanceGraph graph;
    for (const auto& f : files) graph.add_node(f.rel_path, f.role);

    // Ordered containers keep edge construction order stable.
    std::map<std::string, std::set<size_t>> defines;
    std::map<std::string, std::map<size_t, int>> references;

    for (size_t i = 0; i < files.size(); ++i) {
        for (const auto& tag : files[i].tags) {
            if (tag.is_definition()) defines[tag.name].insert(i);
            else references[tag.name][i]++;
        }
    }

    if (references.empty()) {
        // No reference information at all: every definition counts once.
        for (const auto& [ident, definers] : defines) {
            for (size_t d : definers) references[ident][d] = 1;
        }
    }

    for (const auto& [ident, definers] : defines) {
        auto rit = references.find(ident);
        if (rit == references.end()) {
            for (size_t d : definers) graph.add_edge(d, d, ident, kUnreferencedWeight);
            continue;
        }

        double mul = specialness(ident, definers.size(), mentioned_idents.count(ident) > 0, config_);
        for (const auto& [referencer, num_refs] : rit->second) {
            double use_mul = mul;
            if (files[referencer].role == FileRole::Chat) use_mul *= config_.chat_reference_boost;
            for (size_t definer : definers) {
                graph.add_edge(referencer, definer, ident, use_mul * num_refs);
            }
        }
    }

    spdlog::info("🔗 Relevance graph: {} files, {} edges, {} defined idents",
                 graph.node_count(), graph.edge_count(), defines.size());
    return graph;
}

} // namespace repomap
