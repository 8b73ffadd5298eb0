#include "token_counter.hpp"
#include <cmath>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace repomap {

int TokenCounter::approximate(const std::string& text) {
    return static_cast<int>((text.size() + 3) / 4);
}

int TokenCounter::count_exact(const std::string& text) {
    if (!fn_) return approximate(text);

    try {
        int n = fn_(text);
        if (n >= 0) return n;
        if (!degraded_) spdlog::warn("⚠️ Token counter returned {}, using character estimate", n);
    } catch (const std::exception& e) {
        if (!degraded_) spdlog::warn("⚠️ Token counter failed ({}), using character estimate", e.what());
    } catch (...) {
        if (!degraded_) spdlog::warn("⚠️ Token counter failed, using character estimate");
    }
    degraded_ = true;
    return approximate(text);
}

int TokenCounter::count(const std::string& text) {
    calls_++;
    if (!sample_long_texts_ || text.size() < 200) return count_exact(text);

    // Count roughly 100 evenly spaced lines and extrapolate by length.
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) lines.push_back(line + "\n");

    size_t step = lines.size() / 100;
    if (step == 0) step = 1;

    std::string sample;
    for (size_t i = 0; i < lines.size(); i += step) sample += lines[i];
    if (sample.empty()) return count_exact(text);

    double sample_tokens = count_exact(sample);
    double estimate = sample_tokens / static_cast<double>(sample.size()) * static_cast<double>(text.size());
    return static_cast<int>(std::ceil(estimate));
}

} // namespace repomap
