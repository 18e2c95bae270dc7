#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

const NodeRules& JavaExtractor::rules() {
    static const NodeRules r{
        {"class_declaration", "interface_declaration", "enum_declaration", "record_declaration",
         "annotation_type_declaration"},
        {"method_declaration", "constructor_declaration"},
        {},
        {"method_invocation", "object_creation_expression"},
        {"import_declaration"},
        {"superclass", "super_interfaces", "extends_interfaces"},
        {"type_identifier"},
        {"type_identifier", "scoped_type_identifier"},
    };
    return r;
}

const TSLanguage* JavaExtractor::grammar(std::string_view) const {
    return tree_sitter_java();
}

void JavaExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    if (SyntaxTree::type(node) == "object_creation_expression") {
        TSNode type = SyntaxTree::field(node, "type");
        if (SyntaxTree::is_null(type)) return;
        // new Box<T>() -> Box
        if (SyntaxTree::type(type) == "generic_type" && ts_node_named_child_count(type) > 0) {
            type = ts_node_named_child(type, 0);
        }
        out.emplace_back(std::string(tree.text(type)), RelationKind::Call);
        return;
    }

    TSNode name = SyntaxTree::field(node, "name");
    if (!SyntaxTree::is_null(name)) out.emplace_back(std::string(tree.text(name)), RelationKind::Call);
}

void JavaExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        auto type = SyntaxTree::type(child);
        if (type == "scoped_identifier" || type == "identifier") {
            out.emplace_back(std::string(tree.text(child)), RelationKind::Import);
            return;
        }
    }
}

} // namespace code_atlas::extract
