#include "budget_selector.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace repomap {

Selection BudgetSelector::select(
    const std::vector<RankedTag>& ranked,
    int budget,
    const std::vector<std::string>& chat_rel_paths) const
{
    Selection best;
    if (budget <= 0) return best;

    std::string base = renderer_.render(ranked, 0, chat_rel_paths);
    int base_tokens = counter_.count(base);
    best.renders = 1;
    if (base_tokens > budget) {
        spdlog::info("Budget of {} tokens admits nothing ({} needed for headers)", budget, base_tokens);
        return best;
    }
    best.text = std::move(base);
    best.tokens = base_tokens;

    const long n = static_cast<long>(ranked.size());
    long lower = 1;
    long upper = n;
    // First probe assumes ~25 tokens per entry.
    long middle = std::min<long>(std::max<long>(budget / 25, 1), n);

    while (lower <= upper) {
        std::string text = renderer_.render(ranked, static_cast<size_t>(middle), chat_rel_paths);
        int tokens = counter_.count(text);
        best.renders++;

        if (tokens <= budget) {
            if (static_cast<size_t>(middle) >= best.num_entries) {
                best.text = std::move(text);
                best.tokens = tokens;
                best.num_entries = static_cast<size_t>(middle);
            }
            lower = middle + 1;
        } else {
            upper = middle - 1;
        }
        middle = lower + (upper - lower) / 2;
    }

    spdlog::info("📐 Selected {}/{} ranked entries, {} tokens of {} ({} renders)",
                 best.num_entries, n, best.tokens, budget, best.renders);
    return best;
}

} // namespace repomap
