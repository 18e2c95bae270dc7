#include "code_atlas/tree_assembler.hpp"
#include "code_atlas/errors.hpp"
#include "code_atlas/graph_builder.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

std::vector<std::string> file_paths_of(const DependencyGraph& graph, const std::vector<std::string>& entity_ids) {
    std::set<std::string> paths;
    for (const auto& id : entity_ids) {
        if (auto idx = graph.find(id)) paths.insert(graph.entity(*idx).file_path);
    }
    return {paths.begin(), paths.end()};
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

void collect_entity_ids(const Module& m, std::vector<std::string>& out) {
    out.insert(out.end(), m.entity_ids.begin(), m.entity_ids.end());
    for (const auto& c : m.children) collect_entity_ids(c, out);
}

} // namespace

std::string common_directory(const std::vector<std::string>& file_paths) {
    if (file_paths.empty()) return {};
    std::string common = parent_directory(file_paths.front());
    for (std::size_t i = 1; i < file_paths.size() && !common.empty(); ++i) {
        std::string dir = parent_directory(file_paths[i]);
        while (!common.empty() && dir != common && dir.compare(0, common.size() + 1, common + "/") != 0) {
            common = parent_directory(common);
        }
    }
    return common;
}

Module TreeAssembler::from_cluster(const ClusterNode& node) const {
    Module m;
    m.leaf = node.leaf();
    if (m.leaf) {
        for (std::size_t g : node.groups) {
            auto ids = condensed_.member_ids(g);
            m.entity_ids.insert(m.entity_ids.end(), ids.begin(), ids.end());
        }
    } else {
        m.children.reserve(node.children.size());
        for (const auto& child : node.children) m.children.push_back(from_cluster(child));
    }
    return m;
}

void TreeAssembler::describe_leaf(Module& module) const {
    const DependencyGraph& graph = condensed_.graph();
    module.token_count = 0;
    for (const auto& id : module.entity_ids) {
        if (auto idx = graph.find(id)) module.token_count += graph.entity(*idx).token_count;
    }
    module.oversized = module.token_count > config_.max_token_per_leaf_module;
}

// Bottom-up: children first, then totals, path, flags and names.
void TreeAssembler::finish(Module& module, const std::string& id, int depth, bool keep_names) const {
    const DependencyGraph& graph = condensed_.graph();
    module.module_id = id;
    module.depth = depth;

    if (module.leaf) {
        describe_leaf(module);
    } else {
        module.entity_ids.clear();
        module.token_count = 0;
        module.oversized = false;
        for (std::size_t i = 0; i < module.children.size(); ++i) {
            finish(module.children[i], id + "." + std::to_string(i + 1), depth + 1, keep_names);
            module.token_count += module.children[i].token_count;
        }

        // Sibling names stay unique: later clashes get " (2)", " (3)", ...
        std::map<std::string, int> seen;
        for (auto& child : module.children) {
            int n = ++seen[child.name];
            if (n > 1) child.name += " (" + std::to_string(n) + ")";
        }
    }

    std::vector<std::string> ids;
    collect_entity_ids(module, ids);
    auto files = file_paths_of(graph, ids);
    module.path = common_directory(files);
    module.complex = files.size() > 1;

    if (keep_names && !module.name.empty()) {
        return;
    } else if (depth == 0) {
        module.name = config_.repository_name.empty() ? "repository" : config_.repository_name;
    } else if (files.size() == 1) {
        module.name = base_name(files.front());
    } else if (!module.path.empty()) {
        module.name = module.path;
    } else {
        module.name = "(top level)";
    }
}

ModuleTree TreeAssembler::assemble(const ClusterNode& root) const {
    Module m = from_cluster(root);
    finish(m, "root", 0, false);
    ModuleTree tree(std::move(m));
    validate(tree);
    return tree;
}

ModuleTree TreeAssembler::adopt(const Module& saved) const {
    Module m = saved;
    finish(m, "root", 0, true);
    ModuleTree tree(std::move(m));
    validate(tree);
    return tree;
}

void TreeAssembler::validate(const ModuleTree& tree) const {
    const DependencyGraph& graph = condensed_.graph();
    std::vector<int> owner(graph.size(), -1);
    int leaf_number = 0;

    for (const Module* leaf : tree.leaves()) {
        if (leaf->depth > config_.max_depth) {
            throw InvariantViolation(invariant::kDepthBound,
                                     "module " + leaf->module_id + " sits at depth " + std::to_string(leaf->depth) +
                                     ", max_depth is " + std::to_string(config_.max_depth));
        }
        if (!leaf->children.empty()) {
            throw InvariantViolation(invariant::kPartition, "leaf " + leaf->module_id + " has children");
        }
        for (const auto& id : leaf->entity_ids) {
            auto idx = graph.find(id);
            if (!idx) throw InvariantViolation(invariant::kPartition, "unknown entity '" + id + "' in " + leaf->module_id);
            if (owner[*idx] != -1) {
                throw InvariantViolation(invariant::kPartition, "entity '" + id + "' appears in more than one leaf");
            }
            owner[*idx] = leaf_number;
        }
        ++leaf_number;
    }

    // Branches need children, leaves need entities (an empty graph yields one empty root leaf)
    std::vector<const Module*> stack{&tree.root()};
    while (!stack.empty()) {
        const Module* m = stack.back();
        stack.pop_back();
        if (!m->leaf && m->children.empty()) {
            throw InvariantViolation(invariant::kModuleShape, "module " + m->module_id + " is not a leaf but has no children");
        }
        if (m->leaf && m->entity_ids.empty() && !graph.empty()) {
            throw InvariantViolation(invariant::kModuleShape, "leaf " + m->module_id + " has no entities");
        }
        for (const auto& child : m->children) stack.push_back(&child);
    }

    if (tree.max_depth() > config_.max_depth) {
        throw InvariantViolation(invariant::kDepthBound, "tree depth " + std::to_string(tree.max_depth()) +
                                                         " exceeds max_depth " + std::to_string(config_.max_depth));
    }

    for (std::size_t i = 0; i < owner.size(); ++i) {
        if (owner[i] == -1) {
            throw InvariantViolation(invariant::kPartition,
                                     "entity '" + graph.entity(static_cast<EntityIndex>(i)).id + "' is in no leaf");
        }
    }

    // Only a single indivisible group may exceed the leaf budget
    for (const Module* leaf : tree.leaves()) {
        if (leaf->token_count <= config_.max_token_per_leaf_module) continue;
        std::size_t first_group = condensed_.group_of(*graph.find(leaf->entity_ids.front()));
        for (const auto& id : leaf->entity_ids) {
            if (condensed_.group_of(*graph.find(id)) != first_group) {
                throw InvariantViolation(invariant::kLeafBudget,
                                         "leaf " + leaf->module_id + " holds " + std::to_string(leaf->token_count) +
                                         " tokens across several groups, over the leaf budget of " +
                                         std::to_string(config_.max_token_per_leaf_module));
            }
        }
    }

    for (const auto& group : condensed_.groups()) {
        int leaf = owner[group.first()];
        for (EntityIndex m : group.members) {
            if (owner[m] != leaf) {
                throw InvariantViolation(invariant::kGroupIntegrity, "group " + group.id + " is split across leaves");
            }
        }
    }
}

} // namespace code_atlas
