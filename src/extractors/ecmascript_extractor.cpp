// JavaScript and TypeScript share most of their grammar, so both variants live here.
#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

namespace {

bool is_function_value(TSNode value) {
    if (SyntaxTree::is_null(value)) return false;
    auto type = SyntaxTree::type(value);
    return type == "arrow_function" || type == "function_expression" || type == "function" ||
           type == "generator_function";
}

// const handler = (req) => { ... }
bool is_bound_function(TSNode node) {
    return SyntaxTree::type(node) == "variable_declarator" &&
           is_function_value(SyntaxTree::field(node, "value"));
}

std::vector<std::string> bound_parameters(TSNode node, const SyntaxTree& tree) {
    std::vector<std::string> out;
    TSNode fn = SyntaxTree::type(node) == "variable_declarator" ? SyntaxTree::field(node, "value") : node;
    TSNode params = SyntaxTree::field(fn, "parameters");
    if (SyntaxTree::is_null(params)) {
        // x => x * 2
        TSNode single = SyntaxTree::field(fn, "parameter");
        if (!SyntaxTree::is_null(single)) out.emplace_back(tree.text(single));
        return out;
    }
    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(params, i);
        if (SyntaxTree::type(child) == "comment") continue;
        out.emplace_back(tree.text(child));
    }
    return out;
}

std::string first_string_argument(TSNode call, const SyntaxTree& tree) {
    TSNode args = SyntaxTree::field(call, "arguments");
    if (SyntaxTree::is_null(args) || ts_node_named_child_count(args) == 0) return {};
    TSNode first = ts_node_named_child(args, 0);
    auto type = SyntaxTree::type(first);
    if (type != "string" && type != "template_string") return {};
    return unquote(tree.text(first));
}

void ecmascript_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) {
    if (SyntaxTree::type(node) == "new_expression") {
        TSNode ctor = SyntaxTree::field(node, "constructor");
        if (SyntaxTree::is_null(ctor)) return;
        if (SyntaxTree::type(ctor) == "member_expression") ctor = SyntaxTree::field(ctor, "property");
        if (!SyntaxTree::is_null(ctor)) out.emplace_back(std::string(tree.text(ctor)), RelationKind::Call);
        return;
    }

    TSNode fn = SyntaxTree::field(node, "function");
    if (SyntaxTree::is_null(fn)) return;
    auto type = SyntaxTree::type(fn);

    // require("./x") and import("./x") are module edges, not calls
    if (type == "import" || (type == "identifier" && tree.text(fn) == "require")) {
        std::string specifier = first_string_argument(node, tree);
        if (!specifier.empty()) out.emplace_back(std::move(specifier), RelationKind::Import);
        return;
    }

    if (type == "identifier") {
        out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    } else if (type == "member_expression") {
        TSNode prop = SyntaxTree::field(fn, "property");
        if (!SyntaxTree::is_null(prop)) out.emplace_back(std::string(tree.text(prop)), RelationKind::Call);
    }
}

void ecmascript_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) {
    TSNode source = SyntaxTree::field(node, "source");
    if (SyntaxTree::is_null(source)) return;
    std::string specifier = unquote(tree.text(source));
    if (!specifier.empty()) out.emplace_back(std::move(specifier), RelationKind::Import);
}

} // namespace

// --- JavaScript ---

const NodeRules& JavaScriptExtractor::rules() {
    static const NodeRules r{
        {"class_declaration"},
        {"function_declaration", "generator_function_declaration", "method_definition"},
        {},
        {"call_expression", "new_expression"},
        {"import_statement", "export_statement"},
        {"class_heritage"},
        {},
        {"identifier", "member_expression"},
    };
    return r;
}

const TSLanguage* JavaScriptExtractor::grammar(std::string_view) const {
    return tree_sitter_javascript();
}

bool JavaScriptExtractor::is_entity(TSNode node, const SyntaxTree& tree) const {
    return TreeSitterExtractor::is_entity(node, tree) || is_bound_function(node);
}

std::vector<std::string> JavaScriptExtractor::parameters(TSNode node, const SyntaxTree& tree) const {
    return bound_parameters(node, tree);
}

void JavaScriptExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    ecmascript_calls(node, tree, out);
}

void JavaScriptExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    ecmascript_imports(node, tree, out);
}

// --- TypeScript ---

const NodeRules& TypeScriptExtractor::rules() {
    static const NodeRules r{
        {"class_declaration", "abstract_class_declaration", "interface_declaration", "enum_declaration"},
        {"function_declaration", "generator_function_declaration", "method_definition"},
        {"internal_module", "module"},
        {"call_expression", "new_expression"},
        {"import_statement", "export_statement"},
        {"extends_clause", "implements_clause", "extends_type_clause"},
        {"type_identifier"},
        {"identifier", "type_identifier", "member_expression", "nested_type_identifier"},
    };
    return r;
}

const TSLanguage* TypeScriptExtractor::grammar(std::string_view path) const {
    if (path.size() >= 4 && path.substr(path.size() - 4) == ".tsx") return tree_sitter_tsx();
    return tree_sitter_typescript();
}

bool TypeScriptExtractor::is_entity(TSNode node, const SyntaxTree& tree) const {
    return TreeSitterExtractor::is_entity(node, tree) || is_bound_function(node);
}

std::vector<std::string> TypeScriptExtractor::parameters(TSNode node, const SyntaxTree& tree) const {
    return bound_parameters(node, tree);
}

void TypeScriptExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    ecmascript_calls(node, tree, out);
}

void TypeScriptExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    ecmascript_imports(node, tree, out);
}

} // namespace code_atlas::extract
