#include "page_rank.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <map>
#include <spdlog/spdlog.h>

namespace repomap {

namespace fs = std::filesystem;

bool ranked_before(const RankedTag& a, const RankedTag& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.tag.rel_path != b.tag.rel_path) return a.tag.rel_path < b.tag.rel_path;
    if (a.tag.line_start != b.tag.line_start) return a.tag.line_start < b.tag.line_start;
    return a.tag.name < b.tag.name;
}

PersonalizedRanker::PersonalizedRanker(const RepoMapConfig& config) : config_(config) {
    config_.validate();
}

std::vector<double> PersonalizedRanker::personalization(
    const RelevanceGraph& graph,
    const std::set<std::string>& mentioned_idents) const
{
    std::vector<double> p(graph.node_count(), 0.0);
    double total = 0.0;

    for (size_t i = 0; i < graph.node_count(); ++i) {
        const auto& node = graph.nodes()[i];
        double w = config_.other_weight;
        if (node.role == FileRole::Chat) w = config_.chat_weight;
        else if (node.role == FileRole::Mentioned) w = config_.mentioned_weight;

        if (!mentioned_idents.empty() && w < config_.mentioned_weight) {
            fs::path path(node.rel_path);
            bool matches = mentioned_idents.count(path.stem().string()) > 0;
            for (const auto& part : path) {
                if (matches) break;
                matches = mentioned_idents.count(part.string()) > 0;
            }
            if (matches) w = config_.mentioned_weight;
        }

        p[i] = w;
        total += w;
    }

    if (total > 0.0) {
        for (auto& v : p) v /= total;
    }
    return p;
}

RankResult PersonalizedRanker::run(const RelevanceGraph& graph, const std::vector<double>& personalization) const {
    RankResult result;
    const size_t n = graph.node_count();
    if (n == 0) {
        result.converged = true;
        return result;
    }

    auto start = std::chrono::high_resolution_clock::now();
    const double d = config_.damping;
    const std::vector<double>& p = personalization;

    std::vector<double> x(n, 1.0 / static_cast<double>(n));
    if (config_.max_iterations == 0) {
        result.scores = p;
        return result;
    }

    std::vector<double> next(n, 0.0);
    for (int iter = 0; iter < config_.max_iterations; ++iter) {
        std::fill(next.begin(), next.end(), 0.0);

        double dangling = 0.0;
        for (size_t u = 0; u < n; ++u) {
            if (graph.out_weight(u) <= 0.0) dangling += x[u];
        }

        // Edge list order is the traversal order.
        for (const auto& e : graph.edges()) {
            if (e.is_self_edge()) continue;
            next[e.to] += d * x[e.from] * e.weight / graph.out_weight(e.from);
        }

        double err = 0.0;
        for (size_t v = 0; v < n; ++v) {
            next[v] += (d * dangling + (1.0 - d)) * p[v];
            err += std::fabs(next[v] - x[v]);
        }

        x.swap(next);
        result.iterations = iter + 1;
        if (err < static_cast<double>(n) * config_.tolerance) {
            result.converged = true;
            break;
        }
    }

    if (!result.converged) {
        spdlog::warn("⚠️ PageRank stopped at the iteration cap ({}) before converging", config_.max_iterations);
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("⏱️ PageRank: {} nodes, {} iterations, {:.2f} ms", n, result.iterations, duration);

    result.scores = std::move(x);
    return result;
}

std::vector<RankedTag> PersonalizedRanker::distribute(
    const RelevanceGraph& graph,
    const std::vector<FileRecord>& files,
    const RankResult& rank) const
{
    std::vector<RankedTag> ranked;
    if (graph.empty() || rank.scores.size() != graph.node_count()) return ranked;

    // Incoming weight per (file, ident), self-edges included
    std::vector<std::map<std::string, double>> incoming(graph.node_count());
    for (const auto& e : graph.edges()) incoming[e.to][e.ident] += e.weight;

    for (size_t i = 0; i < files.size(); ++i) {
        const auto& file = files[i];
        if (file.role == FileRole::Chat) continue;

        auto idx = graph.node_index(file.rel_path);
        if (!idx) continue;

        double total = 0.0;
        for (const auto& [ident, w] : incoming[*idx]) total += w;
        if (total <= 0.0) continue;

        const double file_score = rank.scores[*idx];
        for (const auto& tag : file.tags) {
            if (!tag.is_definition()) continue;
            auto it = incoming[*idx].find(tag.name);
            double share = it == incoming[*idx].end() ? 0.0 : it->second / total;
            ranked.push_back({tag, file_score * share, false});
        }
    }

    std::sort(ranked.begin(), ranked.end(), ranked_before);
    return ranked;
}

} // namespace repomap
