#include "parser_elite.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <memory>
#include <stack>
#include <unordered_set>

namespace repomap::elite {

namespace {

const char* kPythonTags = R"(
(class_definition name: (identifier) @name.definition.class) @definition.class
(function_definition name: (identifier) @name.definition.function) @definition.function
(module (expression_statement (assignment left: (identifier) @name.definition.constant) @definition.constant))
)";

const char* kCppTags = R"(
(struct_specifier name: (type_identifier) @name.definition.class body: (_)) @definition.class
(union_specifier name: (type_identifier) @name.definition.class body: (_)) @definition.class
(class_specifier name: (type_identifier) @name.definition.class body: (_)) @definition.class
(function_declarator declarator: (identifier) @name.definition.function) @definition.function
(function_declarator declarator: (field_identifier) @name.definition.function) @definition.function
(function_declarator declarator: (qualified_identifier name: (identifier) @name.definition.method)) @definition.method
(type_definition declarator: (type_identifier) @name.definition.type) @definition.type
(enum_specifier name: (type_identifier) @name.definition.type) @definition.type
)";

const char* kJavaScriptTags = R"(
(function_declaration name: (identifier) @name.definition.function) @definition.function
(generator_function_declaration name: (identifier) @name.definition.function) @definition.function
(class_declaration name: (identifier) @name.definition.class) @definition.class
(method_definition name: (property_identifier) @name.definition.method) @definition.method
(lexical_declaration (variable_declarator name: (identifier) @name.definition.function value: (arrow_function))) @definition.function
(variable_declaration (variable_declarator name: (identifier) @name.definition.function value: (arrow_function))) @definition.function
)";

const char* kTypeScriptTags = R"(
(function_declaration name: (identifier) @name.definition.function) @definition.function
(class_declaration name: (type_identifier) @name.definition.class) @definition.class
(abstract_class_declaration name: (type_identifier) @name.definition.class) @definition.class
(interface_declaration name: (type_identifier) @name.definition.interface) @definition.interface
(type_alias_declaration name: (type_identifier) @name.definition.type) @definition.type
(enum_declaration name: (identifier) @name.definition.enum) @definition.enum
(method_definition name: (property_identifier) @name.definition.method) @definition.method
(lexical_declaration (variable_declarator name: (identifier) @name.definition.function value: (arrow_function))) @definition.function
)";

bool is_identifier_leaf(TSNode node) {
    static const std::unordered_set<std::string> leaf_types = {
        "identifier", "type_identifier", "field_identifier", "property_identifier",
        "namespace_identifier", "shorthand_property_identifier", "private_property_identifier"
    };
    return ts_node_is_named(node) && ts_node_child_count(node) == 0 &&
           leaf_types.count(ts_node_type(node)) > 0;
}

bool starts_with(const char* s, uint32_t len, const char* prefix) {
    size_t n = std::strlen(prefix);
    return len >= n && std::strncmp(s, prefix, n) == 0;
}

// Declarators only cover the signature; climb to the node owning the body.
TSNode enclosing_definition(TSNode node) {
    static const std::unordered_set<std::string> owners = {
        "function_definition", "declaration", "field_declaration"
    };
    if (std::strcmp(ts_node_type(node), "function_declarator") != 0) return node;

    TSNode current = node;
    for (int depth = 0; depth < 4; ++depth) {
        TSNode parent = ts_node_parent(current);
        if (ts_node_is_null(parent)) break;
        current = parent;
        if (owners.count(ts_node_type(current))) return current;
    }
    return node;
}

} // namespace

ASTTagger::ASTTagger() {
    parser_ = ts_parser_new();
    load_grammar("python", tree_sitter_python(), kPythonTags);
    load_grammar("cpp", tree_sitter_cpp(), kCppTags);
    load_grammar("c", tree_sitter_cpp(), kCppTags);
    load_grammar("javascript", tree_sitter_javascript(), kJavaScriptTags);
    load_grammar("typescript", tree_sitter_typescript(), kTypeScriptTags);
    load_grammar("tsx", tree_sitter_tsx(), kTypeScriptTags);
}

ASTTagger::~ASTTagger() {
    for (auto& [lang, grammar] : grammars_) {
        if (grammar.query) ts_query_delete(grammar.query);
    }
    if (parser_) ts_parser_delete(parser_);
}

void ASTTagger::load_grammar(const std::string& language, const TSLanguage* ts_language, const std::string& query_source) {
    if (!ts_language) return;

    uint32_t error_offset = 0;
    TSQueryError error_type = TSQueryErrorNone;
    TSQuery* query = ts_query_new(ts_language, query_source.data(), (uint32_t)query_source.size(),
                                  &error_offset, &error_type);
    if (!query) {
        // The heuristic fallback takes over for this language.
        spdlog::warn("⚠️ Tag query for {} rejected at offset {} (error {})", language, error_offset, (int)error_type);
        return;
    }
    grammars_[language] = Grammar{ts_language, query};
}

bool ASTTagger::can_handle(const std::string&, const std::string& language) const {
    return grammars_.count(language) > 0;
}

std::vector<Tag> ASTTagger::extract(
    const std::string& rel_path,
    const std::string& abs_path,
    const std::string& content,
    const std::string& language)
{
    auto it = grammars_.find(language);
    if (it == grammars_.end()) return {};
    const Grammar& grammar = it->second;

    if (!ts_parser_set_language(parser_, grammar.language)) {
        spdlog::warn("⚠️ Grammar ABI mismatch for {}, skipping {}", language, rel_path);
        return {};
    }

    TSTree* raw_tree = ts_parser_parse_string(parser_, nullptr, content.c_str(), (uint32_t)content.length());
    if (!raw_tree) {
        spdlog::warn("⚠️ Parse failed: {}", rel_path);
        return {};
    }
    std::unique_ptr<TSTree, decltype(&ts_tree_delete)> tree(raw_tree, &ts_tree_delete);
    TSNode root = ts_tree_root_node(tree.get());
    if (ts_node_has_error(root)) {
        spdlog::debug("Syntax errors in {}, tagging the recovered tree", rel_path);
    }

    std::vector<Tag> tags;
    std::unordered_set<uint32_t> definition_bytes;

    auto node_text = [&](TSNode node) {
        uint32_t start = ts_node_start_byte(node);
        uint32_t end = ts_node_end_byte(node);
        return content.substr(start, end - start);
    };

    // 🎯 Definitions
    std::unique_ptr<TSQueryCursor, decltype(&ts_query_cursor_delete)> cursor(
        ts_query_cursor_new(), &ts_query_cursor_delete);
    ts_query_cursor_exec(cursor.get(), grammar.query, root);

    TSQueryMatch match;
    while (ts_query_cursor_next_match(cursor.get(), &match)) {
        TSNode name_node{};
        TSNode span_node{};
        bool has_name = false;
        bool has_span = false;

        for (uint16_t i = 0; i < match.capture_count; ++i) {
            const TSQueryCapture& capture = match.captures[i];
            uint32_t len = 0;
            const char* capture_name = ts_query_capture_name_for_id(grammar.query, capture.index, &len);
            if (starts_with(capture_name, len, "name.definition.")) {
                name_node = capture.node;
                has_name = true;
            } else if (starts_with(capture_name, len, "definition.")) {
                span_node = capture.node;
                has_span = true;
            }
        }
        if (!has_name) continue;
        if (!definition_bytes.insert(ts_node_start_byte(name_node)).second) continue;

        TSNode owner = enclosing_definition(has_span ? span_node : name_node);

        Tag def;
        def.rel_path = rel_path;
        def.abs_path = abs_path;
        def.name = node_text(name_node);
        def.kind = TagKind::Definition;
        def.line_start = (int)ts_node_start_point(owner).row;
        def.line_end = (int)ts_node_end_point(owner).row;
        tags.push_back(std::move(def));
    }

    // References: non-recursive walk over every identifier leaf
    std::stack<TSNode> stack;
    stack.push(root);
    while (!stack.empty()) {
        TSNode node = stack.top();
        stack.pop();

        if (is_identifier_leaf(node)) {
            if (!definition_bytes.count(ts_node_start_byte(node))) {
                Tag ref;
                ref.rel_path = rel_path;
                ref.abs_path = abs_path;
                ref.name = node_text(node);
                ref.kind = TagKind::Reference;
                ref.line_start = (int)ts_node_start_point(node).row;
                ref.line_end = (int)ts_node_end_point(node).row;
                tags.push_back(std::move(ref));
            }
            continue;
        }

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push(ts_node_child(node, i - 1));
        }
    }

    std::stable_sort(tags.begin(), tags.end(), [](const Tag& a, const Tag& b) {
        return a.line_start < b.line_start;
    });

    spdlog::debug("🛰️  AST X-Ray Complete: {} tags in {}", tags.size(), rel_path);
    return tags;
}

} // namespace repomap::elite
