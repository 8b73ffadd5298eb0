#include "repo_map.hpp"
#include "budget_selector.hpp"
#include "code_graph.hpp"
#include "errors.hpp"
#include "important_files.hpp"
#include "page_rank.hpp"
#include "tag_extractor.hpp"
#include "tools/FileSystemTools.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <omp.h>
#include <spdlog/spdlog.h>

namespace repomap {

namespace {

constexpr int kContextPadding = 4096;

bool cancelled(const MapRequest& request) {
    return request.cancel && request.cancel->load();
}

} // namespace

RepoMap::RepoMap(RepoMapConfig config, TokenCounter::CountFn token_counter, TextReader reader)
    : config_(std::move(config)),
      token_counter_(std::move(token_counter)),
      reader_(std::move(reader))
{
    config_.validate();
    if (!reader_) reader_ = &FileSystemTools::read_file_safe;
}

fs::path RepoMap::cache_directory(const fs::path& root) const {
    if (config_.cache_dir.empty()) return root / ".repomap.tags.cache.v1";
    fs::path dir(config_.cache_dir);
    return dir.is_absolute() ? dir : root / dir;
}

int RepoMap::effective_budget(int requested, bool has_chat_files) const {
    if (requested <= 0 || has_chat_files || config_.max_context_window <= 0) return requested;

    // With nothing in the chat the map is the main context: let it grow.
    long target = std::min<long>((long)requested * config_.map_mul_no_files,
                                 (long)config_.max_context_window - kContextPadding);
    return target > 0 ? (int)target : requested;
}

std::vector<FileRecord> RepoMap::collect_files(const fs::path& root, const MapRequest& request) const {
    std::map<std::string, FileRole> roles; // abs path -> role

    auto assign = [&](const std::vector<std::string>& paths, FileRole role) {
        for (const auto& p : paths) {
            if (p.empty()) continue;
            std::string abs = FileSystemTools::normalize(root, p).string();
            auto it = roles.find(abs);
            if (it == roles.end()) {
                roles.emplace(abs, role);
            } else if (role < it->second) {
                it->second = role; // enum order is precedence
            }
        }
    };
    assign(request.chat_files, FileRole::Chat);
    assign(request.mentioned_files, FileRole::Mentioned);
    assign(request.other_files, FileRole::Other);

    std::vector<FileRecord> files;
    for (const auto& [abs, role] : roles) {
        std::error_code ec;
        if (!fs::is_regular_file(abs, ec)) {
            spdlog::warn("⚠️ Repo-map can't include {}: not a readable file", abs);
            continue;
        }
        FileRecord record;
        record.path = abs;
        record.rel_path = FileSystemTools::relative_to(root, abs);
        record.language_hint = detect_language(abs);
        record.role = role;
        files.push_back(std::move(record));
    }

    std::sort(files.begin(), files.end(), [](const FileRecord& a, const FileRecord& b) {
        return a.rel_path < b.rel_path;
    });
    return files;
}

void RepoMap::extract_tags(std::vector<FileRecord>& files, TagCache& cache, bool force_refresh) const {
    const int n = static_cast<int>(files.size());
    const int threads = config_.extract_threads > 0 ? config_.extract_threads : omp_get_max_threads();
    auto start = std::chrono::high_resolution_clock::now();

    #pragma omp parallel num_threads(threads)
    {
        // tree-sitter parsers are per thread
        std::unique_ptr<ExtractorRegistry> registry;
        try {
            registry = ExtractorRegistry::with_defaults();
        } catch (const std::exception& e) {
            spdlog::error("❌ Extractor setup failed: {}", e.what());
        }

        #pragma omp for schedule(dynamic)
        for (int i = 0; i < n; ++i) {
            FileRecord& file = files[i];
            try {
                auto id = FileIdentity::of(file.path);
                if (!id) {
                    spdlog::warn("⚠️ Cannot stat {}, skipping", file.rel_path);
                    continue;
                }
                file.mtime = id->mtime;
                file.size = id->size;

                file.tags = cache.get_tags(*id, file.rel_path, [&]() -> std::optional<std::vector<Tag>> {
                    if (file.size > config_.max_file_bytes) {
                        spdlog::warn("⚠️ {} exceeds {} bytes, not tagged", file.rel_path, config_.max_file_bytes);
                        return std::vector<Tag>{};
                    }
                    auto text = reader_(file.path);
                    if (!text) return std::nullopt;
                    if (!registry) return std::nullopt;
                    return registry->extract(file.rel_path, file.path, *text, file.language_hint);
                }, force_refresh);
            } catch (const std::exception& e) {
                spdlog::warn("⚠️ Tagging {} failed: {}", file.rel_path, e.what());
                file.tags.clear();
            }
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    double duration = std::chrono::duration<double, std::milli>(end - start).count();
    spdlog::info("🛰️ Tagged {} files on {} threads in {:.2f} ms", n, threads, duration);
}

std::vector<RankedTag> RepoMap::rank_tags(
    const std::vector<FileRecord>& files,
    const std::set<std::string>& mentioned_idents,
    MapStats* stats) const
{
    GraphBuilder builder(config_);
    RelevanceGraph graph = builder.build(files, mentioned_idents);
    if (graph.empty()) return {};

    PersonalizedRanker ranker(config_);
    RankResult rank = ranker.run(graph, ranker.personalization(graph, mentioned_idents));
    std::vector<RankedTag> definitions = ranker.distribute(graph, files, rank);

    if (stats) {
        stats->edges = graph.edge_count();
        stats->iterations = rank.iterations;
        stats->converged = rank.converged;
    }

    auto file_score = [&](const FileRecord& f) {
        auto idx = graph.node_index(f.rel_path);
        return idx ? rank.scores[*idx] : 0.0;
    };
    auto header = [&](const FileRecord& f) {
        RankedTag entry;
        entry.tag.rel_path = f.rel_path;
        entry.tag.abs_path = f.path;
        entry.tag.kind = TagKind::Definition;
        entry.score = file_score(f);
        entry.header_only = true;
        return entry;
    };

    std::vector<RankedTag> ranked;
    std::set<std::string> listed;

    std::vector<std::string> candidates;
    std::map<std::string, const FileRecord*> by_rel_path;
    for (const auto& f : files) {
        if (f.role == FileRole::Chat) continue;
        candidates.push_back(f.rel_path);
        by_rel_path[f.rel_path] = &f;
    }
    for (const auto& rel : filter_important_files(candidates)) {
        ranked.push_back(header(*by_rel_path.at(rel)));
        listed.insert(rel);
    }

    for (auto& d : definitions) {
        listed.insert(d.tag.rel_path);
        ranked.push_back(std::move(d));
    }

    std::vector<RankedTag> rest;
    for (const auto& f : files) {
        if (f.role == FileRole::Chat || listed.count(f.rel_path)) continue;
        rest.push_back(header(f));
    }
    std::sort(rest.begin(), rest.end(), ranked_before);
    ranked.insert(ranked.end(), rest.begin(), rest.end());

    return ranked;
}

MapResult RepoMap::get_repo_map(const MapRequest& request) const {
    MapResult result;

    std::error_code ec;
    fs::path root = fs::absolute(request.root.empty() ? "." : request.root, ec);
    if (ec || !fs::is_directory(root, ec)) {
        throw RepoMapError("repository root is not an accessible directory: " + request.root);
    }
    root = root.lexically_normal();
    fs::directory_iterator probe(root, ec);
    if (ec) {
        throw RepoMapError("cannot read repository root " + root.string() + ": " + ec.message());
    }

    int requested = request.map_tokens.value_or(config_.map_tokens);
    if (requested <= 0) {
        spdlog::info("Map budget is {}, nothing to do", requested);
        return result;
    }

    // 🚀 PHASE 1: FILE SET
    std::vector<FileRecord> files = collect_files(root, request);
    result.stats.files = files.size();
    if (files.empty()) {
        spdlog::info("No files qualify for the repository map");
        return result;
    }

    std::vector<std::string> chat_rel_paths;
    for (const auto& f : files) {
        if (f.role == FileRole::Chat) chat_rel_paths.push_back(f.rel_path);
    }
    const int budget = effective_budget(requested, !chat_rel_paths.empty());
    result.stats.budget = budget;

    // 🚀 PHASE 2: TAGS (cached, parallel)
    {
        auto cache = TagCache::open(cache_directory(root));
        extract_tags(files, *cache, request.force_refresh);
        result.stats.cache_hits = cache->stats().hits.load();
        result.stats.cache_misses = cache->stats().misses.load();
        cache->close();
    }
    for (const auto& f : files) {
        result.stats.tags += f.tags.size();
        result.stats.definitions += std::count_if(f.tags.begin(), f.tags.end(),
                                                  [](const Tag& t) { return t.is_definition(); });
    }
    if (cancelled(request)) {
        result.stats.cancelled = true;
        return result;
    }

    // 🚀 PHASE 3: GRAPH + RANK
    std::vector<RankedTag> ranked = rank_tags(files, request.mentioned_idents, &result.stats);
    result.stats.ranked_entries = ranked.size();
    if (cancelled(request)) {
        result.stats.cancelled = true;
        return result;
    }

    // 🚀 PHASE 4: SELECT + RENDER
    RenderOptions options;
    options.merge_gap = config_.merge_gap;
    options.max_line_length = config_.max_line_length;
    MapRenderer renderer(files, reader_, options);
    TokenCounter counter(token_counter_, config_.sample_token_count);
    BudgetSelector selector(renderer, counter);

    Selection selection = selector.select(ranked, budget, chat_rel_paths);
    result.stats.selected_entries = selection.num_entries;
    result.stats.tokens = selection.tokens;
    result.stats.token_counter_degraded = counter.degraded();
    if (cancelled(request)) {
        result.stats.cancelled = true;
        return result;
    }

    result.text = std::move(selection.text);
    spdlog::info("✅ Repo map ready: {} files, {} ranked entries, {} selected, {} tokens",
                 result.stats.files, result.stats.ranked_entries, result.stats.selected_entries,
                 result.stats.tokens);
    return result;
}

} // namespace repomap
