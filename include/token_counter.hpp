#pragma once
#include <functional>
#include <string>

namespace repomap {

// Wraps the caller's tokenizer. A throwing callback or a negative count
// falls back to ceil(chars / 4) and marks the counter degraded.
class TokenCounter {
public:
    using CountFn = std::function<int(const std::string&)>;

    // An empty `fn` means character approximation only (not degraded).
    explicit TokenCounter(CountFn fn = {}, bool sample_long_texts = false)
        : fn_(std::move(fn)), sample_long_texts_(sample_long_texts) {}

    int count(const std::string& text);

    bool degraded() const { return degraded_; }
    size_t calls() const { return calls_; }

    static int approximate(const std::string& text);

private:
    CountFn fn_;
    bool sample_long_texts_;
    bool degraded_ = false;
    size_t calls_ = 0;

    int count_exact(const std::string& text);
};

} // namespace repomap
