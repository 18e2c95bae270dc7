#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

namespace {

bool is_php_name(std::string_view type) {
    return type == "name" || type == "qualified_name";
}

// include 'a.php', require_once __DIR__ . '/b.php'
std::string included_path(TSNode node, const SyntaxTree& tree) {
    std::vector<TSNode> stack{node};
    std::string last;
    while (!stack.empty()) {
        TSNode n = stack.back();
        stack.pop_back();
        auto type = SyntaxTree::type(n);
        if (type == "string" || type == "encapsed_string") {
            last = unquote(tree.text(n));
            continue;
        }
        uint32_t count = ts_node_named_child_count(n);
        for (uint32_t i = count; i > 0; --i) stack.push_back(ts_node_named_child(n, i - 1));
    }
    if (!last.empty() && last.front() == '/') last.erase(0, 1);
    return last;
}

} // namespace

const NodeRules& PhpExtractor::rules() {
    static const NodeRules r{
        {"class_declaration", "interface_declaration", "trait_declaration", "enum_declaration"},
        {"function_definition", "method_declaration"},
        {"namespace_definition"},
        {"function_call_expression", "member_call_expression", "scoped_call_expression",
         "nullsafe_member_call_expression", "object_creation_expression"},
        {"namespace_use_declaration", "include_expression", "include_once_expression",
         "require_expression", "require_once_expression"},
        {"base_clause", "class_interface_clause"},
        {},
        {"name", "qualified_name"},
    };
    return r;
}

const TSLanguage* PhpExtractor::grammar(std::string_view) const {
    return tree_sitter_php();
}

void PhpExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    auto type = SyntaxTree::type(node);
    TSNode target{};
    if (type == "function_call_expression") {
        target = SyntaxTree::field(node, "function");
    } else if (type == "object_creation_expression") {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (is_php_name(SyntaxTree::type(child))) {
                target = child;
                break;
            }
        }
    } else {
        target = SyntaxTree::field(node, "name");
    }
    if (SyntaxTree::is_null(target) || !is_php_name(SyntaxTree::type(target))) return;
    out.emplace_back(std::string(tree.text(target)), RelationKind::Call);
}

void PhpExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    if (SyntaxTree::type(node) != "namespace_use_declaration") {
        std::string path = included_path(node, tree);
        if (!path.empty()) out.emplace_back(std::move(path), RelationKind::Import);
        return;
    }

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode clause = ts_node_named_child(node, i);
        if (SyntaxTree::type(clause) != "namespace_use_clause") continue;
        uint32_t parts = ts_node_named_child_count(clause);
        for (uint32_t k = 0; k < parts; ++k) {
            TSNode part = ts_node_named_child(clause, k);
            if (is_php_name(SyntaxTree::type(part))) {
                out.emplace_back(std::string(tree.text(part)), RelationKind::Import);
                break;
            }
        }
    }
}

} // namespace code_atlas::extract
