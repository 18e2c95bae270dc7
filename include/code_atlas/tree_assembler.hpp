#pragma once
#include <string>
#include <vector>
#include "code_atlas/clustering_engine.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/cycle_resolver.hpp"
#include "code_atlas/module_tree.hpp"

namespace code_atlas {

// Turns a cluster structure (or a saved grouping) into a validated ModuleTree.
class TreeAssembler {
public:
    TreeAssembler(const Config& config, const CondensedGraph& condensed)
        : config_(config), condensed_(condensed) {}

    // Assigns ids, names, totals and flags. Throws InvariantViolation.
    ModuleTree assemble(const ClusterNode& root) const;

    // Keeps the saved structure, membership and names but recomputes ids,
    // totals, flags, paths and depths against the current graph. Throws InvariantViolation
    // when the saved tree does not fit the graph.
    ModuleTree adopt(const Module& saved) const;

    // Partition, depth bound and group integrity. Throws InvariantViolation.
    void validate(const ModuleTree& tree) const;

private:
    Module from_cluster(const ClusterNode& node) const;
    void finish(Module& module, const std::string& id, int depth, bool keep_names) const;
    void describe_leaf(Module& module) const;

    const Config& config_;
    const CondensedGraph& condensed_;
};

// Longest common directory of a set of '/'-separated file paths.
std::string common_directory(const std::vector<std::string>& file_paths);

} // namespace code_atlas
