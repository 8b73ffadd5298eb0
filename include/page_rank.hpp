#pragma once
#include <set>
#include <string>
#include <vector>
#include "code_graph.hpp"
#include "config.hpp"
#include "tag.hpp"

namespace repomap {

struct RankResult {
    std::vector<double> scores; // indexed like graph.nodes()
    int iterations = 0;
    bool converged = false;
};

// Personalized PageRank over the relevance graph by power iteration.
//
//   x' = (1 - d) p + d (sum_{u->v} x[u] w(u,v) / W_out(u) + dangling p)
//
// Self-edges do not propagate. Nodes without outgoing cross-file weight are
// dangling; their mass is redistributed along p. Iteration stops when
// sum |x' - x| < N * tolerance or after max_iterations.
class PersonalizedRanker {
public:
    // Throws ConfigError on invalid damping / tolerance / iteration cap.
    explicit PersonalizedRanker(const RepoMapConfig& config);

    // Role weights normalised to sum 1. Files whose path components match
    // a mentioned identifier get at least the mentioned weight.
    std::vector<double> personalization(
        const RelevanceGraph& graph,
        const std::set<std::string>& mentioned_idents) const;

    RankResult run(const RelevanceGraph& graph, const std::vector<double>& personalization) const;

    // Splits each non-chat file's score over its definitions in proportion
    // to the incoming weight of each identifier. Sorted by score desc, then
    // path, then line.
    std::vector<RankedTag> distribute(
        const RelevanceGraph& graph,
        const std::vector<FileRecord>& files,
        const RankResult& rank) const;

private:
    const RepoMapConfig& config_;
};

// Strict ordering used for ranked output.
bool ranked_before(const RankedTag& a, const RankedTag& b);

} // namespace repomap
