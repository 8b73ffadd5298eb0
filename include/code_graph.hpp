#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "tag.hpp"

namespace repomap {

struct GraphNode {
    std::string rel_path;
    FileRole role = FileRole::Other;
};

// One edge per (referencer, definer, identifier).
struct GraphEdge {
    size_t from;
    size_t to;
    std::string ident;
    double weight;

    bool is_self_edge() const { return from == to; }
};

// Directed multigraph over files. Node and edge order is insertion order,
// which the builder keeps deterministic.
class RelevanceGraph {
public:
    size_t add_node(const std::string& rel_path, FileRole role);
    // Throws std::invalid_argument for non-positive weights or unknown nodes.
    void add_edge(size_t from, size_t to, const std::string& ident, double weight);

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }
    std::optional<size_t> node_index(const std::string& rel_path) const;

    // Sum of outgoing weights, self-edges excluded.
    double out_weight(size_t node) const { return out_weight_[node]; }

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::vector<double> out_weight_;
    std::unordered_map<std::string, size_t> index_;
};

// Multiplier for references to `ident`. Never zero; never larger for a name
// defined in more files than for the same name defined in fewer.
double specialness(
    const std::string& ident,
    size_t num_definers,
    bool mentioned,
    const RepoMapConfig& config);

class GraphBuilder {
public:
    static constexpr double kUnreferencedWeight = 0.1;

    explicit GraphBuilder(const RepoMapConfig& config) : config_(config) {}

    // `files` must be sorted by rel_path with unique paths.
    RelevanceGraph build(
        const std::vector<FileRecord>& files,
        const std::set<std::string>& mentioned_idents) const;

private:
    const RepoMapConfig& config_;
};

} // namespace repomap
