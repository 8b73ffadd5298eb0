#include "tag.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace repomap {

namespace fs = std::filesystem;
using json = nlohmann::json;

json Tag::to_json() const {
    return json{
        {"name", name},
        {"kind", kind == TagKind::Definition ? "def" : "ref"},
        {"start", line_start},
        {"end", line_end}
    };
}

Tag Tag::from_json(const json& j, const std::string& rel_path, const std::string& abs_path) {
    Tag tag;
    tag.rel_path = rel_path;
    tag.abs_path = abs_path;
    tag.name = j.at("name").get<std::string>();
    tag.kind = j.at("kind").get<std::string>() == "def" ? TagKind::Definition : TagKind::Reference;
    tag.line_start = j.at("start").get<int>();
    tag.line_end = j.at("end").get<int>();
    return tag;
}

const char* to_string(TagKind kind) {
    return kind == TagKind::Definition ? "definition" : "reference";
}

const char* to_string(FileRole role) {
    switch (role) {
        case FileRole::Chat: return "chat";
        case FileRole::Mentioned: return "mentioned";
        case FileRole::Other: return "other";
    }
    return "other";
}

std::string detect_language(const std::string& path) {
    static const std::unordered_map<std::string, std::string> by_ext = {
        {"py", "python"}, {"pyi", "python"},
        {"c", "c"}, {"h", "cpp"},
        {"cc", "cpp"}, {"cpp", "cpp"}, {"cxx", "cpp"}, {"hh", "cpp"}, {"hpp", "cpp"}, {"hxx", "cpp"},
        {"js", "javascript"}, {"jsx", "javascript"}, {"mjs", "javascript"}, {"cjs", "javascript"},
        {"ts", "typescript"}, {"mts", "typescript"}, {"tsx", "tsx"},
        {"go", "go"}, {"rs", "rust"}, {"java", "java"}, {"kt", "kotlin"}, {"kts", "kotlin"},
        {"scala", "scala"}, {"rb", "ruby"}, {"php", "php"}, {"cs", "csharp"}, {"swift", "swift"},
        {"lua", "lua"}, {"sh", "bash"}, {"bash", "bash"}, {"el", "elisp"}, {"ex", "elixir"},
        {"exs", "elixir"}, {"elm", "elm"}, {"dart", "dart"}, {"ml", "ocaml"}, {"hs", "haskell"},
        {"jl", "julia"}, {"r", "r"}, {"zig", "zig"}, {"sol", "solidity"}
    };

    std::string ext = fs::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = by_ext.find(ext);
    return it == by_ext.end() ? std::string() : it->second;
}

} // namespace repomap
