#include "heuristic_tagger.hpp"
#include <cctype>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace repomap {

namespace {

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> words = {
        "abstract", "and", "as", "async", "await", "begin", "bool", "break", "case", "catch",
        "char", "class", "const", "continue", "def", "default", "defer", "defmodule", "defp",
        "del", "do", "double", "elif", "else", "elsif", "end", "enum", "except", "export",
        "extends", "false", "final", "finally", "float", "fn", "for", "from", "func", "function",
        "go", "if", "impl", "implements", "import", "in", "int", "interface", "is", "let",
        "local", "loop", "match", "mod", "module", "mut", "new", "nil", "not", "null", "object",
        "open", "or", "override", "package", "private", "protected", "pub", "public", "raise",
        "record", "return", "select", "self", "static", "string", "struct", "super", "switch",
        "then", "this", "throw", "throws", "trait", "true", "try", "type", "union", "unless",
        "until", "use", "val", "var", "void", "when", "where", "while", "with", "yield"
    };
    return words;
}

std::string line_comment_for(const std::string& language) {
    static const std::unordered_set<std::string> hash = {
        "python", "ruby", "bash", "elixir", "r", "julia", "perl"
    };
    static const std::unordered_set<std::string> dash = {"lua", "haskell", "elm", "sql"};
    if (hash.count(language)) return "#";
    if (dash.count(language)) return "--";
    if (language == "elisp") return ";";
    return "//";
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

int indent_of(const std::string& line) {
    int n = 0;
    for (char c : line) {
        if (c == ' ') n++;
        else if (c == '\t') n += 4;
        else break;
    }
    return n;
}

// Definition keywords sit near the start of a line; the regex only ever
// sees this many bytes past the indentation.
constexpr size_t kMaxHeadBytes = 256;

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

} // namespace

HeuristicTagger::HeuristicTagger()
    : def_re_(R"(^(?:(?:pub(?:\([a-z]+\))?|public|private|protected|internal|static|export|default|async|abstract|final|open|override|sealed|data|inline|unsafe)\s+)*(?:def|defp|defmodule|class|struct|interface|function|fn|func|enum|trait|module|type|object|record|union)\s+(?:\([^)]*\)\s*)?([A-Za-z_][A-Za-z0-9_]*))") {}

bool HeuristicTagger::can_handle(const std::string&, const std::string& language) const {
    return !language.empty();
}

std::vector<std::string> HeuristicTagger::clean_lines(const std::vector<std::string>& lines, const std::string& language) {
    const std::string comment = line_comment_for(language);
    const bool c_block = comment == "//";
    bool in_block = false;

    std::vector<std::string> cleaned;
    cleaned.reserve(lines.size());

    // Strings and comments are blanked, not removed, so columns stay valid.
    for (const auto& line : lines) {
        std::string out = line;
        size_t i = 0;
        while (i < out.size()) {
            if (in_block) {
                if (out.compare(i, 2, "*/") == 0) {
                    out[i] = out[i + 1] = ' ';
                    in_block = false;
                    i += 2;
                } else {
                    out[i++] = ' ';
                }
                continue;
            }
            if (c_block && out.compare(i, 2, "/*") == 0) {
                out[i] = out[i + 1] = ' ';
                in_block = true;
                i += 2;
                continue;
            }
            if (out.compare(i, comment.size(), comment) == 0) {
                for (size_t k = i; k < out.size(); ++k) out[k] = ' ';
                break;
            }
            char c = out[i];
            if (c == '"' || c == '\'' || c == '`') {
                out[i++] = ' ';
                while (i < out.size()) {
                    if (out[i] == '\\' && i + 1 < out.size()) {
                        out[i] = out[i + 1] = ' ';
                        i += 2;
                        continue;
                    }
                    bool closing = out[i] == c;
                    out[i++] = ' ';
                    if (closing) break;
                }
                continue;
            }
            ++i;
        }
        cleaned.push_back(std::move(out));
    }
    return cleaned;
}

int HeuristicTagger::block_end(const std::vector<std::string>& cleaned, int def_line) {
    const int n = static_cast<int>(cleaned.size());
    const std::string& head = cleaned[def_line];

    size_t last = head.find_last_not_of(" \t");
    if (last != std::string::npos && head[last] == ':') {
        // Indented block
        int base = indent_of(head);
        int end = def_line;
        for (int j = def_line + 1; j < n; ++j) {
            if (is_blank(cleaned[j])) continue;
            if (indent_of(cleaned[j]) <= base) break;
            end = j;
        }
        return end;
    }

    // Brace block, opening on the definition line or the next one
    int open_line = -1;
    for (int j = def_line; j < n && j <= def_line + 1; ++j) {
        if (cleaned[j].find('{') != std::string::npos) {
            open_line = j;
            break;
        }
    }
    if (open_line < 0) return def_line;

    int level = 0;
    for (int j = open_line; j < n; ++j) {
        for (char c : cleaned[j]) {
            if (c == '{') level++;
            if (c == '}') level--;
        }
        if (level <= 0) return j;
    }
    return n - 1;
}

std::vector<Tag> HeuristicTagger::extract(
    const std::string& rel_path,
    const std::string& abs_path,
    const std::string& content,
    const std::string& language)
{
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }

    auto cleaned = clean_lines(lines, language);
    std::vector<Tag> tags;

    for (int row = 0; row < static_cast<int>(cleaned.size()); ++row) {
        const std::string& text = cleaned[row];

        long def_pos = -1;
        size_t lead = text.find_first_not_of(" \t");
        std::smatch match;
        const std::string head = lead == std::string::npos ? std::string() : text.substr(lead, kMaxHeadBytes);
        if (!head.empty() && std::regex_search(head, match, def_re_)) {
            size_t name_start = lead + static_cast<size_t>(match.position(1));
            size_t name_end = name_start;
            while (name_end < text.size() && is_ident_char(text[name_end])) ++name_end;
            def_pos = static_cast<long>(name_start);

            Tag def;
            def.rel_path = rel_path;
            def.abs_path = abs_path;
            def.name = text.substr(name_start, name_end - name_start);
            def.kind = TagKind::Definition;
            def.line_start = row;
            def.line_end = block_end(cleaned, row);
            tags.push_back(std::move(def));
        }

        size_t i = 0;
        while (i < text.size()) {
            char c = text[i];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                while (i < text.size() && is_ident_char(text[i])) ++i;
                continue;
            }
            if (!is_ident_start(c)) {
                ++i;
                continue;
            }
            size_t start = i;
            while (i < text.size() && is_ident_char(text[i])) ++i;
            if (static_cast<long>(start) == def_pos) continue;

            std::string word = text.substr(start, i - start);
            if (keywords().count(word)) continue;

            Tag ref;
            ref.rel_path = rel_path;
            ref.abs_path = abs_path;
            ref.name = std::move(word);
            ref.kind = TagKind::Reference;
            ref.line_start = row;
            ref.line_end = row;
            tags.push_back(std::move(ref));
        }
    }

    spdlog::debug("Heuristic scan: {} tags in {}", tags.size(), rel_path);
    return tags;
}

} // namespace repomap
