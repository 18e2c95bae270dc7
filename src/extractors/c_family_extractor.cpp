// C and C++ variants. Function names hide behind declarator chains in both grammars.
#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

namespace {

bool is_declarator_wrapper(std::string_view type) {
    return type == "function_declarator" || type == "pointer_declarator" ||
           type == "reference_declarator" || type == "parenthesized_declarator" ||
           type == "attributed_declarator";
}

TSNode find_function_declarator(TSNode declarator) {
    TSNode cur = declarator;
    while (!SyntaxTree::is_null(cur)) {
        auto type = SyntaxTree::type(cur);
        if (type == "function_declarator") return cur;
        if (!is_declarator_wrapper(type)) break;
        TSNode next = SyntaxTree::field(cur, "declarator");
        if (SyntaxTree::is_null(next) && ts_node_named_child_count(cur) > 0) next = ts_node_named_child(cur, 0);
        cur = next;
    }
    return TSNode{};
}

// Record types only count when they carry a body: `struct foo *p;` is a use, not a definition.
bool is_record_definition(TSNode node, const NodeRules& rules) {
    if (!contains(rules.class_nodes, SyntaxTree::type(node))) return false;
    return !SyntaxTree::is_null(SyntaxTree::field(node, "body")) &&
           !SyntaxTree::is_null(SyntaxTree::field(node, "name"));
}

std::vector<std::string> declarator_parameters(TSNode node, const SyntaxTree& tree) {
    std::vector<std::string> out;
    TSNode fn = find_function_declarator(SyntaxTree::field(node, "declarator"));
    if (SyntaxTree::is_null(fn)) return out;
    TSNode params = SyntaxTree::field(fn, "parameters");
    if (SyntaxTree::is_null(params)) return out;
    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(params, i);
        if (SyntaxTree::type(child) == "comment") continue;
        out.emplace_back(tree.text(child));
    }
    return out;
}

void include_target(TSNode node, const SyntaxTree& tree, RelationSink& out) {
    TSNode path = SyntaxTree::field(node, "path");
    if (SyntaxTree::is_null(path)) return;
    std::string specifier = unquote(tree.text(path));
    if (!specifier.empty()) out.emplace_back(std::move(specifier), RelationKind::Import);
}

} // namespace

TSNode innermost_declarator(TSNode declarator) {
    TSNode cur = declarator;
    while (!SyntaxTree::is_null(cur) && is_declarator_wrapper(SyntaxTree::type(cur))) {
        TSNode next = SyntaxTree::field(cur, "declarator");
        if (SyntaxTree::is_null(next) && ts_node_named_child_count(cur) > 0) next = ts_node_named_child(cur, 0);
        cur = next;
    }
    return cur;
}

std::string declarator_name(TSNode function_definition, const SyntaxTree& tree) {
    TSNode inner = innermost_declarator(SyntaxTree::field(function_definition, "declarator"));
    if (SyntaxTree::is_null(inner)) return {};
    auto type = SyntaxTree::type(inner);
    if (type == "identifier" || type == "field_identifier" || type == "qualified_identifier" ||
        type == "destructor_name" || type == "operator_name" || type == "template_function") {
        return std::string(tree.text(inner));
    }
    return {};
}

// --- C ---

const NodeRules& CExtractor::rules() {
    static const NodeRules r{
        {"struct_specifier", "union_specifier", "enum_specifier"},
        {"function_definition"},
        {},
        {"call_expression"},
        {"preproc_include"},
        {},
        {"type_identifier"},
        {},
    };
    return r;
}

const TSLanguage* CExtractor::grammar(std::string_view) const {
    return tree_sitter_c();
}

bool CExtractor::is_entity(TSNode node, const SyntaxTree&) const {
    if (SyntaxTree::type(node) == "function_definition") return true;
    return is_record_definition(node, rules());
}

std::string CExtractor::entity_name(TSNode node, const SyntaxTree& tree) const {
    if (SyntaxTree::type(node) == "function_definition") return declarator_name(node, tree);
    return TreeSitterExtractor::entity_name(node, tree);
}

std::vector<std::string> CExtractor::parameters(TSNode node, const SyntaxTree& tree) const {
    return declarator_parameters(node, tree);
}

void CExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    TSNode fn = SyntaxTree::field(node, "function");
    if (SyntaxTree::is_null(fn)) return;
    auto type = SyntaxTree::type(fn);
    if (type == "identifier") {
        out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    } else if (type == "field_expression") {
        TSNode field = SyntaxTree::field(fn, "field");
        if (!SyntaxTree::is_null(field)) out.emplace_back(std::string(tree.text(field)), RelationKind::Call);
    }
}

void CExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    include_target(node, tree, out);
}

// --- C++ ---

const NodeRules& CppExtractor::rules() {
    static const NodeRules r{
        {"class_specifier", "struct_specifier", "union_specifier", "enum_specifier"},
        {"function_definition"},
        {"namespace_definition"},
        {"call_expression", "new_expression"},
        {"preproc_include"},
        {"base_class_clause"},
        {"type_identifier"},
        {"type_identifier", "qualified_identifier"},
    };
    return r;
}

const TSLanguage* CppExtractor::grammar(std::string_view) const {
    return tree_sitter_cpp();
}

bool CppExtractor::is_entity(TSNode node, const SyntaxTree&) const {
    if (SyntaxTree::type(node) == "function_definition") return true;
    return is_record_definition(node, rules());
}

std::string CppExtractor::entity_name(TSNode node, const SyntaxTree& tree) const {
    if (SyntaxTree::type(node) == "function_definition") return declarator_name(node, tree);

    TSNode name = SyntaxTree::field(node, "name");
    // template_type names like Box<T> keep only the template name
    if (SyntaxTree::type(name) == "template_type") name = SyntaxTree::field(name, "name");
    return std::string(tree.text(name));
}

std::vector<std::string> CppExtractor::parameters(TSNode node, const SyntaxTree& tree) const {
    return declarator_parameters(node, tree);
}

void CppExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    if (SyntaxTree::type(node) == "new_expression") {
        TSNode type = SyntaxTree::field(node, "type");
        if (SyntaxTree::type(type) == "template_type") type = SyntaxTree::field(type, "name");
        if (!SyntaxTree::is_null(type)) out.emplace_back(std::string(tree.text(type)), RelationKind::Call);
        return;
    }

    TSNode fn = SyntaxTree::field(node, "function");
    if (SyntaxTree::is_null(fn)) return;
    auto type = SyntaxTree::type(fn);
    if (type == "identifier" || type == "qualified_identifier") {
        out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    } else if (type == "field_expression") {
        TSNode field = SyntaxTree::field(fn, "field");
        if (!SyntaxTree::is_null(field)) out.emplace_back(std::string(tree.text(field)), RelationKind::Call);
    } else if (type == "template_function") {
        TSNode name = SyntaxTree::field(fn, "name");
        if (!SyntaxTree::is_null(name)) out.emplace_back(std::string(tree.text(name)), RelationKind::Call);
    }
}

void CppExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    include_target(node, tree, out);
}

} // namespace code_atlas::extract
