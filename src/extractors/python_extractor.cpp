#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

const NodeRules& PythonExtractor::rules() {
    static const NodeRules r{
        /*class_nodes*/ {"class_definition"},
        /*callable_nodes*/ {"function_definition"},
        /*scope_nodes*/ {},
        /*call_nodes*/ {"call"},
        /*import_nodes*/ {"import_statement", "import_from_statement"},
        /*heritage_nodes*/ {},
        /*type_ref_nodes*/ {},
        /*base_name_nodes*/ {"identifier", "attribute"},
    };
    return r;
}

const TSLanguage* PythonExtractor::grammar(std::string_view) const {
    return tree_sitter_python();
}

// Superclasses are an argument_list hanging off the class definition.
bool PythonExtractor::is_heritage(TSNode node, const SyntaxTree&) const {
    if (SyntaxTree::type(node) != "argument_list") return false;
    TSNode parent = ts_node_parent(node);
    return !SyntaxTree::is_null(parent) && SyntaxTree::type(parent) == "class_definition";
}

// class A(Base, pkg.Mixin, Generic[T], metaclass=Meta): keyword arguments are not bases,
// their values are only referenced.
void PythonExtractor::collect_bases(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    auto is_name = [](TSNode n) {
        auto type = SyntaxTree::type(n);
        return type == "identifier" || type == "attribute";
    };

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(node, i);
        auto type = SyntaxTree::type(arg);
        if (is_name(arg)) {
            out.emplace_back(std::string(tree.text(arg)), RelationKind::Inherit);
        } else if (type == "subscript") {
            TSNode value = SyntaxTree::field(arg, "value");
            if (is_name(value)) out.emplace_back(std::string(tree.text(value)), RelationKind::Inherit);
        } else if (type == "keyword_argument") {
            TSNode value = SyntaxTree::field(arg, "value");
            if (is_name(value)) out.emplace_back(std::string(tree.text(value)), RelationKind::Reference);
        }
    }
}

void PythonExtractor::collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    TSNode fn = SyntaxTree::field(node, "function");
    if (SyntaxTree::is_null(fn)) return;

    auto type = SyntaxTree::type(fn);
    if (type == "identifier") {
        out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    } else if (type == "attribute") {
        TSNode attr = SyntaxTree::field(fn, "attribute");
        if (!SyntaxTree::is_null(attr)) out.emplace_back(std::string(tree.text(attr)), RelationKind::Call);
    }
}

void PythonExtractor::collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
    auto module_text = [&](TSNode n) -> std::string {
        if (SyntaxTree::type(n) == "aliased_import") n = SyntaxTree::field(n, "name");
        return std::string(tree.text(n));
    };

    if (SyntaxTree::type(node) == "import_statement") {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            auto type = SyntaxTree::type(child);
            if (type == "dotted_name" || type == "aliased_import") {
                out.emplace_back(module_text(child), RelationKind::Import);
            }
        }
        return;
    }

    // from <module> import a, b  ->  "<module>" plus "<module>.a", "<module>.b" (submodules)
    TSNode module = SyntaxTree::field(node, "module_name");
    if (SyntaxTree::is_null(module)) return;
    std::string base(tree.text(module));
    out.emplace_back(base, RelationKind::Import);

    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(node, i);
        if (ts_node_eq(child, module)) continue;
        auto type = SyntaxTree::type(child);
        if (type != "dotted_name" && type != "aliased_import") continue;
        std::string name = module_text(child);
        std::string joined = (!base.empty() && base.back() == '.') ? base + name : base + "." + name;
        out.emplace_back(std::move(joined), RelationKind::Import);
    }
}

} // namespace code_atlas::extract
