#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include "errors.hpp"
#include "repo_map.hpp"
#include "test_support.hpp"

using namespace repomap;
using repomap::test_support::TempDir;

class RepoMapTest : public ::testing::Test {
protected:
    TempDir dir_{"repomap_e2e"};

    std::string file(const std::string& rel, const std::string& content) {
        return dir_.write(rel, content).string();
    }

    MapRequest request_for(std::vector<std::string> other, std::vector<std::string> chat = {}) {
        MapRequest request;
        request.root = dir_.path().string();
        request.other_files = std::move(other);
        request.chat_files = std::move(chat);
        return request;
    }

    // x.py and y.py each define a name that r.py uses once.
    std::vector<std::string> two_definers() {
        return {
            file("r.py", "alpha()\nbeta()\n"),
            file("x.py", "def alpha():\n    return 1\n"),
            file("y.py", "def beta():\n    return 2\n"),
        };
    }
};

// ─── Basic maps ───────────────────────────────────────────────

TEST_F(RepoMapTest, DefinitionIsShownAndUserIsListed) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "from a import foo\nfoo()\n");

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({a, b}));

    EXPECT_EQ(result.text,
        "\na.py:\n"
        "│def foo():\n"
        "⋮\n"
        "\nb.py:\n");
    EXPECT_EQ(result.stats.files, 2u);
    EXPECT_EQ(result.stats.definitions, 1u);
    EXPECT_LE(result.stats.tokens, 1024);
    EXPECT_FALSE(result.stats.cancelled);
}

TEST_F(RepoMapTest, ChatFilesAreHeadersOnly) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "def unused():\n    pass\nfoo()\n");

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({a}, {b}));

    EXPECT_EQ(result.text,
        "\nb.py:\n"
        "\na.py:\n"
        "│def foo():\n"
        "⋮\n");
    EXPECT_EQ(result.text.find("unused"), std::string::npos);
}

TEST_F(RepoMapTest, MentionedIdentifierIsRankedFirst) {
    auto files = two_definers();
    RepoMap repo_map;

    auto plain = repo_map.get_repo_map(request_for(files));
    EXPECT_LT(plain.text.find("x.py:"), plain.text.find("y.py:"));

    auto request = request_for(files);
    request.mentioned_idents = {"beta"};
    auto mentioned = repo_map.get_repo_map(request);
    EXPECT_LT(mentioned.text.find("y.py:"), mentioned.text.find("x.py:"));
}

TEST_F(RepoMapTest, MentionedFileIsRankedFirst) {
    auto files = two_definers();
    auto request = request_for(files);
    request.mentioned_files = {"y.py"};

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request);
    EXPECT_LT(result.text.find("y.py:"), result.text.find("x.py:"));
}

TEST_F(RepoMapTest, MentionedFileGivenAsAbsolutePath) {
    auto files = two_definers();
    auto request = request_for(files);
    request.mentioned_files = {(dir_.path() / "y.py").string()};

    RepoMap repo_map;
    auto records = repo_map.collect_files(dir_.path(), request);
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].rel_path, "y.py");
    EXPECT_EQ(records[2].role, FileRole::Mentioned);

    auto result = repo_map.get_repo_map(request);
    EXPECT_LT(result.text.find("y.py:"), result.text.find("x.py:"));
}

TEST_F(RepoMapTest, ImportantFilesAreListed) {
    auto readme = file("README.md", "# Project\n");
    auto a = file("a.py", "def foo():\n    return 1\n");

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({a, readme}));
    EXPECT_NE(result.text.find("\nREADME.md:\n"), std::string::npos);
    EXPECT_NE(result.text.find("│def foo():"), std::string::npos);
}

// ─── Budget ───────────────────────────────────────────────────

TEST_F(RepoMapTest, NonPositiveBudgetIsEmpty) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    RepoMap repo_map;

    auto request = request_for({a});
    request.map_tokens = 0;
    EXPECT_EQ(repo_map.get_repo_map(request).text, "");

    request.map_tokens = -5;
    EXPECT_EQ(repo_map.get_repo_map(request).text, "");
}

TEST_F(RepoMapTest, SmallerBudgetNeverGrowsTheMap) {
    std::vector<std::string> files;
    for (int i = 0; i < 12; ++i) {
        std::string n = std::to_string(i);
        files.push_back(file("m" + n + ".py", "def func_" + n + "():\n    return helper_" + n + "()\n"));
        files.push_back(file("h" + n + ".py", "def helper_" + n + "():\n    return " + n + "\n"));
    }

    RepoMap repo_map;
    size_t previous = 0;
    for (int budget : {10, 40, 80, 160, 320, 2000}) {
        auto request = request_for(files);
        request.map_tokens = budget;
        auto result = repo_map.get_repo_map(request);
        EXPECT_LE(result.stats.tokens, budget);
        EXPECT_GE(result.stats.selected_entries, previous) << budget;
        previous = result.stats.selected_entries;
    }
}

TEST_F(RepoMapTest, NoChatFilesExpandsBudgetWithinWindow) {
    RepoMapConfig cfg;
    cfg.max_context_window = 16000;
    RepoMap repo_map(cfg);

    EXPECT_EQ(repo_map.effective_budget(1024, false), 8192);
    EXPECT_EQ(repo_map.effective_budget(1024, true), 1024);
    EXPECT_EQ(repo_map.effective_budget(4000, false), 16000 - 4096);

    RepoMap unknown_window;
    EXPECT_EQ(unknown_window.effective_budget(1024, false), 1024);
}

// ─── File set ─────────────────────────────────────────────────

TEST_F(RepoMapTest, ChatRoleWinsOverOther) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto request = request_for({a, "a.py"}, {a});

    RepoMap repo_map;
    auto files = repo_map.collect_files(dir_.path(), request);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].rel_path, "a.py");
    EXPECT_EQ(files[0].role, FileRole::Chat);
}

TEST_F(RepoMapTest, MissingFilesAreSkipped) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({a, (dir_.path() / "ghost.py").string()}));
    EXPECT_EQ(result.stats.files, 1u);
    EXPECT_NE(result.text.find("a.py:"), std::string::npos);
}

TEST_F(RepoMapTest, InvalidRootThrows) {
    RepoMap repo_map;
    MapRequest request;
    request.root = (dir_.path() / "does" / "not" / "exist").string();
    EXPECT_THROW(repo_map.get_repo_map(request), RepoMapError);

    request.root = file("plain.txt", "not a directory");
    EXPECT_THROW(repo_map.get_repo_map(request), RepoMapError);
}

TEST_F(RepoMapTest, InvalidConfigThrows) {
    RepoMapConfig cfg;
    cfg.max_iterations = -3;
    EXPECT_THROW(RepoMap{cfg}, ConfigError);
}

// ─── Degradation ──────────────────────────────────────────────

TEST_F(RepoMapTest, UnknownLanguagesAreListedWithoutTags) {
    auto notes = file("notes.txt", "def looks_like_code():\n");
    auto a = file("a.py", "def foo():\n    return 1\n");

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({notes, a}));
    EXPECT_NE(result.text.find("\nnotes.txt:\n"), std::string::npos);
    EXPECT_EQ(result.text.find("looks_like_code"), std::string::npos);
}

TEST_F(RepoMapTest, UnreadableFilesStillProduceAMap) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "foo()\n");

    RepoMap repo_map(RepoMapConfig{}, {}, [](const std::string&) -> std::optional<std::string> {
        return std::nullopt;
    });
    auto result = repo_map.get_repo_map(request_for({a, b}));
    EXPECT_EQ(result.stats.tags, 0u);
    EXPECT_NE(result.text.find("a.py:"), std::string::npos);
    EXPECT_NE(result.text.find("b.py:"), std::string::npos);
}

TEST_F(RepoMapTest, BrokenTokenizerFallsBack) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "foo()\n");

    RepoMap repo_map(RepoMapConfig{}, [](const std::string&) -> int {
        throw std::runtime_error("tokenizer offline");
    });
    auto result = repo_map.get_repo_map(request_for({a, b}));
    EXPECT_TRUE(result.stats.token_counter_degraded);
    EXPECT_NE(result.text.find("│def foo():"), std::string::npos);
}

// ─── Cache & determinism ──────────────────────────────────────

TEST_F(RepoMapTest, RepeatedCallsAreIdenticalAndCached) {
    auto files = two_definers();
    RepoMap repo_map;

    auto first = repo_map.get_repo_map(request_for(files));
    auto second = repo_map.get_repo_map(request_for(files));

    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.stats.cache_misses, 3u);
    EXPECT_EQ(second.stats.cache_hits, 3u);
    EXPECT_EQ(second.stats.cache_misses, 0u);
    EXPECT_TRUE(fs::is_directory(repo_map.cache_directory(dir_.path())));
}

TEST_F(RepoMapTest, EditedFileIsRetagged) {
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "foo()\n");
    RepoMap repo_map;
    repo_map.get_repo_map(request_for({a, b}));

    file("a.py", "def renamed_function():\n    return 1\n\n\n");
    auto request = request_for({a, b});
    auto result = repo_map.get_repo_map(request);
    EXPECT_NE(result.text.find("renamed_function"), std::string::npos);
    EXPECT_EQ(result.stats.cache_misses, 1u);
}

TEST_F(RepoMapTest, ForceRefreshBypassesCache) {
    auto files = two_definers();
    RepoMap repo_map;
    repo_map.get_repo_map(request_for(files));

    auto request = request_for(files);
    request.force_refresh = true;
    auto result = repo_map.get_repo_map(request);
    EXPECT_EQ(result.stats.cache_hits, 0u);
    EXPECT_EQ(result.stats.cache_misses, 3u);
}

TEST_F(RepoMapTest, CancelledRequestReturnsNothing) {
    auto files = two_definers();
    std::atomic<bool> cancel{true};
    auto request = request_for(files);
    request.cancel = &cancel;

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request);
    EXPECT_TRUE(result.stats.cancelled);
    EXPECT_EQ(result.text, "");
}

// ─── Reference scenarios ──────────────────────────────────────

namespace {

double helper_score(const RepoMap& repo_map, const fs::path& root, const MapRequest& request) {
    auto files = repo_map.collect_files(root, request);
    auto cache = TagCache::open(repo_map.cache_directory(root));
    repo_map.extract_tags(files, *cache, true);
    for (const auto& entry : repo_map.rank_tags(files, {})) {
        if (!entry.header_only && entry.tag.name == "helper") return entry.score;
    }
    return 0.0;
}

} // namespace

TEST_F(RepoMapTest, ChatCallerLiftsCalleeFile) {
    auto a = file("a.py", "def parse():\n    return helper()\n");
    auto b = file("b.py", "def helper():\n    return 1\n");
    auto request = request_for({b}, {a});

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request);
    EXPECT_EQ(result.text.rfind("\na.py:\n", 0), 0u);
    EXPECT_NE(result.text.find("\nb.py:\n│def helper():"), std::string::npos);

    double with_call = helper_score(repo_map, dir_.path(), request);
    EXPECT_GT(with_call, 0.0);

    file("a.py", "def parse():\n    return 1\n");
    double without_call = helper_score(repo_map, dir_.path(), request);
    EXPECT_LT(without_call, with_call);
}

TEST_F(RepoMapTest, BrokenSyntaxDoesNotSinkTheMap) {
    auto bad = file("bad.py", "def (((:\n  class ]]] {{\n\x01\x02\n");
    auto a = file("a.py", "def foo():\n    return 1\n");
    auto b = file("b.py", "foo()\n");

    RepoMap repo_map;
    auto result = repo_map.get_repo_map(request_for({bad, a, b}));
    EXPECT_NE(result.text.find("│def foo():"), std::string::npos);
    EXPECT_NE(result.text.find("b.py:"), std::string::npos);
}
