#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include "heuristic_tagger.hpp"
#include "tag_extractor.hpp"

using namespace repomap;

namespace {

const Tag* find_tag(const std::vector<Tag>& tags, const std::string& name, TagKind kind) {
    auto it = std::find_if(tags.begin(), tags.end(), [&](const Tag& t) {
        return t.name == name && t.kind == kind;
    });
    return it == tags.end() ? nullptr : &*it;
}

size_t count_refs(const std::vector<Tag>& tags, const std::string& name) {
    return std::count_if(tags.begin(), tags.end(), [&](const Tag& t) {
        return t.name == name && t.kind == TagKind::Reference;
    });
}

} // namespace

// ─── Definitions ──────────────────────────────────────────────

TEST(HeuristicTaggerTest, IndentedBlocks) {
    HeuristicTagger tagger;
    const std::string src =
        "class Greeter:\n"
        "    def greet(self, name):\n"
        "        # call helper\n"
        "        return format_name(name)\n"
        "\n"
        "def format_name(n):\n"
        "    return \"x\" + n\n";

    auto tags = tagger.extract("greet.py", "/r/greet.py", src, "python");

    const Tag* cls = find_tag(tags, "Greeter", TagKind::Definition);
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->line_start, 0);
    EXPECT_EQ(cls->line_end, 3);

    const Tag* method = find_tag(tags, "greet", TagKind::Definition);
    ASSERT_NE(method, nullptr);
    EXPECT_EQ(method->line_start, 1);
    EXPECT_EQ(method->line_end, 3);

    const Tag* fn = find_tag(tags, "format_name", TagKind::Definition);
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->line_start, 5);
    EXPECT_EQ(fn->line_end, 6);
    EXPECT_EQ(fn->rel_path, "greet.py");
    EXPECT_EQ(fn->abs_path, "/r/greet.py");
}

TEST(HeuristicTaggerTest, BraceBlocks) {
    HeuristicTagger tagger;
    const std::string src =
        "fn main() {\n"
        "    let x = helper(1);\n"
        "    println!(\"{}\", x);\n"
        "}\n"
        "\n"
        "pub fn helper(v: i32) -> i32 {\n"
        "    v + 1\n"
        "}\n";

    auto tags = tagger.extract("main.rs", "/r/main.rs", src, "rust");

    const Tag* main_fn = find_tag(tags, "main", TagKind::Definition);
    ASSERT_NE(main_fn, nullptr);
    EXPECT_EQ(main_fn->line_start, 0);
    EXPECT_EQ(main_fn->line_end, 3);

    const Tag* helper = find_tag(tags, "helper", TagKind::Definition);
    ASSERT_NE(helper, nullptr);
    EXPECT_EQ(helper->line_start, 5);
    EXPECT_EQ(helper->line_end, 7);

    const Tag* call = find_tag(tags, "helper", TagKind::Reference);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->line_start, 1);
}

TEST(HeuristicTaggerTest, GoReceiverMethods) {
    HeuristicTagger tagger;
    const std::string src =
        "func (s *Server) Start() error {\n"
        "    return s.listen()\n"
        "}\n";

    auto tags = tagger.extract("server.go", "/r/server.go", src, "go");
    ASSERT_NE(find_tag(tags, "Start", TagKind::Definition), nullptr);
    EXPECT_EQ(find_tag(tags, "Server", TagKind::Definition), nullptr);
    EXPECT_NE(find_tag(tags, "listen", TagKind::Reference), nullptr);
}

// ─── References ───────────────────────────────────────────────

TEST(HeuristicTaggerTest, CommentsAndStringsAreNotReferences) {
    HeuristicTagger tagger;
    const std::string src =
        "/* func Hidden() */\n"
        "func Visible() {\n"
        "    log(\"mentions Quoted here\") // and Trailing\n"
        "}\n";

    auto tags = tagger.extract("x.go", "/r/x.go", src, "go");
    EXPECT_EQ(find_tag(tags, "Hidden", TagKind::Definition), nullptr);
    EXPECT_NE(find_tag(tags, "Visible", TagKind::Definition), nullptr);
    EXPECT_EQ(count_refs(tags, "Quoted"), 0u);
    EXPECT_EQ(count_refs(tags, "Trailing"), 0u);
    EXPECT_EQ(count_refs(tags, "log"), 1u);
}

TEST(HeuristicTaggerTest, DefinitionNameIsNotAlsoAReference) {
    HeuristicTagger tagger;
    auto tags = tagger.extract("a.py", "/r/a.py", "def foo():\n    return foo()\n", "python");
    EXPECT_NE(find_tag(tags, "foo", TagKind::Definition), nullptr);
    EXPECT_EQ(count_refs(tags, "foo"), 1u);
    EXPECT_EQ(count_refs(tags, "return"), 0u);
}

TEST(HeuristicTaggerTest, SameInputSameTags) {
    HeuristicTagger tagger;
    const std::string src = "class A:\n    def b(self):\n        return c(d)\n";
    EXPECT_EQ(tagger.extract("a.py", "/r/a.py", src, "python"),
              tagger.extract("a.py", "/r/a.py", src, "python"));
}

TEST(HeuristicTaggerTest, EmptyInput) {
    HeuristicTagger tagger;
    EXPECT_TRUE(tagger.extract("e.py", "/r/e.py", "", "python").empty());
}

TEST(HeuristicTaggerTest, HugeIndentationIsScannedLinearly) {
    HeuristicTagger tagger;
    const std::string pad(200000, ' ');

    auto tags = tagger.extract("a.go", "/r/a.go", pad + "x = 1\n", "go");
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0].name, "x");
    EXPECT_EQ(tags[0].kind, TagKind::Reference);

    tags = tagger.extract("b.go", "/r/b.go", pad + "func far() {\n" + pad + "}\n", "go");
    const Tag* def = find_tag(tags, "far", TagKind::Definition);
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->line_start, 0);
    EXPECT_EQ(def->line_end, 1);
}

TEST(HeuristicTaggerTest, LongDefinitionNameIsKeptWhole) {
    HeuristicTagger tagger;
    const std::string name(400, 'n');
    auto tags = tagger.extract("a.go", "/r/a.go", "func " + name + "() {}\n", "go");
    EXPECT_NE(find_tag(tags, name, TagKind::Definition), nullptr);
    EXPECT_EQ(count_refs(tags, name), 0u);
}

// ─── Registry ─────────────────────────────────────────────────

namespace {

class ThrowingExtractor : public TagExtractor {
public:
    std::string name() const override { return "throwing"; }
    bool can_handle(const std::string&, const std::string& language) const override { return language == "go"; }
    std::vector<Tag> extract(const std::string&, const std::string&, const std::string&, const std::string&) override {
        throw std::runtime_error("grammar exploded");
    }
};

} // namespace

TEST(ExtractorRegistryTest, FailingExtractorYieldsNoTags) {
    ExtractorRegistry registry;
    registry.register_extractor(std::make_unique<ThrowingExtractor>());
    registry.set_fallback(std::make_unique<HeuristicTagger>());

    EXPECT_TRUE(registry.extract("x.go", "/r/x.go", "func A() {}\n", "go").empty());
    // Languages the first extractor declines go to the fallback.
    EXPECT_FALSE(registry.extract("x.rs", "/r/x.rs", "fn a() {}\n", "rust").empty());
}

TEST(ExtractorRegistryTest, UnknownLanguageYieldsNoTags) {
    ExtractorRegistry registry;
    registry.set_fallback(std::make_unique<HeuristicTagger>());
    EXPECT_TRUE(registry.extract("notes.txt", "/r/notes.txt", "def foo():\n", "").empty());
}
