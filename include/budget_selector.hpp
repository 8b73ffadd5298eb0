#pragma once
#include <string>
#include <vector>
#include "map_renderer.hpp"
#include "tag.hpp"
#include "token_counter.hpp"

namespace repomap {

struct Selection {
    std::string text;
    size_t num_entries = 0; // ranked entries included
    int tokens = 0;
    int renders = 0;
};

// Largest prefix of the ranked list whose rendering fits the budget, found
// by bisection (rendered size grows with the prefix length).
class BudgetSelector {
public:
    BudgetSelector(const MapRenderer& renderer, TokenCounter& counter)
        : renderer_(renderer), counter_(counter) {}

    // Empty text when the budget is non-positive or when not even the chat
    // file headers fit.
    Selection select(
        const std::vector<RankedTag>& ranked,
        int budget,
        const std::vector<std::string>& chat_rel_paths) const;

private:
    const MapRenderer& renderer_;
    TokenCounter& counter_;
};

} // namespace repomap
