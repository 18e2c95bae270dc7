#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

const NodeRules& CSharpExtractor::rules() {
    static const NodeRules r{
        {"class_declaration", "interface_declaration", "struct_declaration", "enum_declaration",
         "record_declaration"},
        {"method_declaration", "constructor_declaration", "local_function_statement"},
        {"namespace_declaration", "file_scoped_namespace_declaration"},
        {"invocation_expression", "object_creation_expression"},
        {"using_directive"},
        {"base_list"},
        {},
        {"identifier", "qualified_name"},
    };
    return r;
}

const TSLanguage* CSharpExtractor::grammar(std::string_view) const {
    return tree_sitter_c_sharp();
}

void CSharpExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    if (SyntaxTree::type(node) == "object_creation_expression") {
        TSNode type = SyntaxTree::field(node, "type");
        if (SyntaxTree::type(type) == "generic_name" && ts_node_named_child_count(type) > 0) {
            type = ts_node_named_child(type, 0);
        }
        if (!SyntaxTree::is_null(type)) out.emplace_back(std::string(tree.text(type)), RelationKind::Call);
        return;
    }

    TSNode fn = SyntaxTree::field(node, "function");
    if (SyntaxTree::is_null(fn)) return;
    if (SyntaxTree::type(fn) == "member_access_expression") fn = SyntaxTree::field(fn, "name");
    // Run<T>() -> Run
    if (SyntaxTree::type(fn) == "generic_name" && ts_node_named_child_count(fn) > 0) {
        fn = ts_node_named_child(fn, 0);
    }
    if (SyntaxTree::type(fn) == "identifier") {
        out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    }
}

void CSharpExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    // using Alias = A.B; names the target last
    TSNode target{};
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        auto type = SyntaxTree::type(child);
        if (type == "qualified_name" || type == "identifier") target = child;
    }
    if (!SyntaxTree::is_null(target)) out.emplace_back(std::string(tree.text(target)), RelationKind::Import);
}

} // namespace code_atlas::extract
