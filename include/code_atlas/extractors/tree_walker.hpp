#pragma once
#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "code_atlas/entity.hpp"
#include "code_atlas/extractors/syntax_tree.hpp"

namespace code_atlas::extract {

// Node-type tables for one grammar.
struct NodeRules {
    std::vector<std::string_view> class_nodes;
    std::vector<std::string_view> callable_nodes;
    std::vector<std::string_view> scope_nodes;     // qualify names, never entities
    std::vector<std::string_view> call_nodes;
    std::vector<std::string_view> import_nodes;
    std::vector<std::string_view> heritage_nodes;
    std::vector<std::string_view> type_ref_nodes;
    std::vector<std::string_view> base_name_nodes; // what counts as a name inside heritage
};

bool contains(const std::vector<std::string_view>& list, std::string_view type);

// Collected (target, kind) pairs before they are tied to a source entity.
using RelationSink = std::vector<std::pair<std::string, RelationKind>>;

// Joins a scope chain and a possibly qualified name with '.'.
std::string qualify(std::string_view prefix, std::string_view name);

// '::', '->', '\\' and '/' separators become '.'; surrounding whitespace is dropped.
std::string normalize_symbol(std::string_view name);

// Token counts exclusive of directly nested entities. parents[i] is the
// enclosing entity of i, or -1 for the file entity.
void assign_exclusive_tokens(std::vector<Entity>& entities, const std::vector<long>& parents,
                             std::string_view source);

// Shared traversal. Derived supplies rules() and grammar(path), and may hide
// any hook below to adjust it for its grammar.
template <typename Derived>
class TreeSitterExtractor {
public:
    std::vector<Entity> extract_entities(const SyntaxTree& tree, std::string_view path) const;
    std::vector<SymbolicRelation> extract_relations(const SyntaxTree& tree,
                                                    const std::vector<Entity>& entities) const;

    // --- hooks ---
    bool is_entity(TSNode node, const SyntaxTree&) const {
        auto type = SyntaxTree::type(node);
        const auto& r = self().rules();
        return contains(r.class_nodes, type) || contains(r.callable_nodes, type);
    }

    bool is_class(TSNode node) const {
        return contains(self().rules().class_nodes, SyntaxTree::type(node));
    }

    std::string entity_name(TSNode node, const SyntaxTree& tree) const {
        TSNode name = SyntaxTree::field(node, "name");
        if (!SyntaxTree::is_null(name)) return std::string(tree.text(name));

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            auto type = SyntaxTree::type(child);
            if (type == "identifier" || type == "type_identifier" || type == "name") {
                return std::string(tree.text(child));
            }
        }
        return {};
    }

    std::string scope_name(TSNode node, const SyntaxTree& tree) const {
        return std::string(tree.text(SyntaxTree::field(node, "name")));
    }

    std::vector<std::string> parameters(TSNode node, const SyntaxTree& tree) const {
        return parameter_texts(SyntaxTree::field(node, "parameters"), tree);
    }

    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
        TSNode fn = SyntaxTree::field(node, "function");
        if (!SyntaxTree::is_null(fn)) out.emplace_back(std::string(tree.text(fn)), RelationKind::Call);
    }

    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
        out.emplace_back(std::string(tree.text(node)), RelationKind::Import);
    }

    bool is_heritage(TSNode node, const SyntaxTree&) const {
        return contains(self().rules().heritage_nodes, SyntaxTree::type(node));
    }

    void collect_bases(TSNode node, const SyntaxTree& tree, RelationSink& out) const {
        collect_names(node, tree, self().rules().base_name_nodes, RelationKind::Inherit, out);
    }

protected:
    static std::vector<std::string> parameter_texts(TSNode params, const SyntaxTree& tree) {
        std::vector<std::string> out;
        if (SyntaxTree::is_null(params)) return out;
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(params, i);
            if (SyntaxTree::type(child) == "comment") continue;
            out.emplace_back(tree.text(child));
        }
        return out;
    }

    // Outermost descendants whose type is in `name_types`; generic argument lists are skipped.
    static void collect_names(TSNode node, const SyntaxTree& tree,
                              const std::vector<std::string_view>& name_types,
                              RelationKind kind, RelationSink& out) {
        std::vector<TSNode> stack{node};
        std::vector<std::string> found;
        while (!stack.empty()) {
            TSNode n = stack.back();
            stack.pop_back();
            auto type = SyntaxTree::type(n);
            if (!ts_node_eq(n, node) && contains(name_types, type)) {
                found.emplace_back(tree.text(n));
                continue;
            }
            if (type == "type_arguments" || type == "template_argument_list" ||
                type == "type_argument_list") {
                continue;
            }
            uint32_t count = ts_node_named_child_count(n);
            for (uint32_t i = count; i > 0; --i) stack.push_back(ts_node_named_child(n, i - 1));
        }
        for (auto& f : found) out.emplace_back(std::move(f), kind);
    }

private:
    const Derived& self() const { return static_cast<const Derived&>(*this); }

    bool inside_heritage(TSNode node, const SyntaxTree& tree) const;
    bool is_entity_name(TSNode node) const;
};

// ---------------------------------------------------------------------------

template <typename Derived>
std::vector<Entity> TreeSitterExtractor<Derived>::extract_entities(const SyntaxTree& tree,
                                                                   std::string_view path) const {
    const Derived& d = self();
    std::string_view source = tree.source();

    std::vector<Entity> entities;
    std::vector<long> parents;

    Entity file;
    file.id = std::string(path);
    auto slash = path.find_last_of('/');
    file.name = std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
    file.kind = EntityKind::File;
    file.language = Derived::kLanguage;
    file.file_path = std::string(path);
    file.span = {0, static_cast<std::uint32_t>(source.size()), 1,
                 SyntaxTree::end_line(tree.root())};
    file.source_text = std::string(source);
    file.declaration_order = 0;
    entities.push_back(std::move(file));
    parents.push_back(-1);

    struct Frame {
        TSNode node;
        long parent;
        std::string prefix;
    };

    // Iterative pre-order so declaration order follows the source
    std::vector<Frame> stack;
    stack.push_back({tree.root(), 0, ""});

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        TSNode node = frame.node;
        auto type = SyntaxTree::type(node);
        long parent = frame.parent;
        std::string prefix = frame.prefix;

        if (contains(d.rules().scope_nodes, type)) {
            std::string scope = normalize_symbol(d.scope_name(node, tree));
            if (!scope.empty()) prefix = qualify(prefix, scope);
        } else if (d.is_entity(node, tree)) {
            std::string raw_name = d.entity_name(node, tree);
            if (!raw_name.empty()) {
                std::string qualified = qualify(prefix, normalize_symbol(raw_name));
                auto last_dot = qualified.find_last_of('.');
                bool nested_scope = normalize_symbol(raw_name).find('.') != std::string::npos;

                Entity e;
                e.name = last_dot == std::string::npos ? qualified : qualified.substr(last_dot + 1);
                e.qualified_name = qualified;
                e.language = Derived::kLanguage;
                e.file_path = std::string(path);
                e.id = std::string(path) + "::" + qualified;
                e.span = {ts_node_start_byte(node), ts_node_end_byte(node),
                          SyntaxTree::start_line(node), SyntaxTree::end_line(node)};
                e.source_text = std::string(tree.text(node));
                e.declaration_order = static_cast<std::uint32_t>(entities.size());

                if (d.is_class(node)) {
                    e.kind = EntityKind::Class;
                } else {
                    bool in_class = parent > 0 && entities[parent].kind == EntityKind::Class;
                    e.kind = (in_class || nested_scope) ? EntityKind::Method : EntityKind::Function;
                    e.parameters = d.parameters(node, tree);
                }

                parent = static_cast<long>(entities.size());
                prefix = qualified;
                entities.push_back(std::move(e));
                parents.push_back(frame.parent);
            }
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) {
            stack.push_back({ts_node_named_child(node, i - 1), parent, prefix});
        }
    }

    assign_exclusive_tokens(entities, parents, source);
    return entities;
}

template <typename Derived>
bool TreeSitterExtractor<Derived>::is_entity_name(TSNode node) const {
    TSNode parent = ts_node_parent(node);
    if (SyntaxTree::is_null(parent)) return false;
    TSNode name = SyntaxTree::field(parent, "name");
    return !SyntaxTree::is_null(name) && ts_node_eq(name, node);
}

template <typename Derived>
bool TreeSitterExtractor<Derived>::inside_heritage(TSNode node, const SyntaxTree& tree) const {
    TSNode cur = ts_node_parent(node);
    for (int hops = 0; hops < 5 && !SyntaxTree::is_null(cur); ++hops) {
        if (self().is_heritage(cur, tree)) return true;
        cur = ts_node_parent(cur);
    }
    return false;
}

template <typename Derived>
std::vector<SymbolicRelation> TreeSitterExtractor<Derived>::extract_relations(
    const SyntaxTree& tree, const std::vector<Entity>& entities) const {
    const Derived& d = self();
    std::vector<SymbolicRelation> relations;

    // Entities are in pre-order, so the last one containing a node is the innermost.
    auto enclosing = [&](TSNode node) -> std::size_t {
        SourceSpan s{ts_node_start_byte(node), ts_node_end_byte(node), 0, 0};
        for (std::size_t i = entities.size(); i > 1; --i) {
            if (entities[i - 1].span.contains(s)) return i - 1;
        }
        return 0;
    };

    RelationSink sink;
    std::vector<TSNode> stack{tree.root()};

    while (!stack.empty()) {
        TSNode node = stack.back();
        stack.pop_back();
        auto type = SyntaxTree::type(node);
        const auto& rules = d.rules();

        sink.clear();
        bool imports_only = false;
        if (contains(rules.import_nodes, type)) {
            d.collect_imports(node, tree, sink);
            imports_only = true;
        } else if (contains(rules.call_nodes, type)) {
            d.collect_calls(node, tree, sink);
        } else if (d.is_heritage(node, tree)) {
            d.collect_bases(node, tree, sink);
        } else if (contains(rules.type_ref_nodes, type) && !is_entity_name(node) &&
                   !inside_heritage(node, tree)) {
            sink.emplace_back(std::string(tree.text(node)), RelationKind::Reference);
        }

        if (!sink.empty()) {
            std::size_t from = imports_only ? 0 : enclosing(node);
            for (auto& [target, kind] : sink) {
                // Imports hang off the file entity wherever they appear
                std::size_t source = kind == RelationKind::Import ? 0 : from;
                std::string cleaned = kind == RelationKind::Import ? target : normalize_symbol(target);
                if (cleaned.empty()) continue;
                relations.push_back({source, std::move(cleaned), kind});
            }
        }

        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = count; i > 0; --i) stack.push_back(ts_node_named_child(node, i - 1));
    }

    return relations;
}

} // namespace code_atlas::extract
