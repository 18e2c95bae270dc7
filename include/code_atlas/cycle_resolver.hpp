#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "code_atlas/code_graph.hpp"

namespace code_atlas {

// A strongly connected component. Members are ascending entity indices, so
// the first member is also the earliest by (file path, declaration order).
struct Group {
    std::string id;                    // entity id, or "scc:<first member id>"
    std::vector<EntityIndex> members;
    std::size_t token_count = 0;

    bool cyclic() const { return members.size() > 1; }
    EntityIndex first() const { return members.front(); }
};

// The DAG of groups. Groups are ordered by their first member.
class CondensedGraph {
public:
    CondensedGraph(const DependencyGraph& graph, std::vector<Group> groups,
                   std::vector<std::size_t> group_of);

    const DependencyGraph& graph() const { return *graph_; }
    const std::vector<Group>& groups() const { return groups_; }
    const Group& group(std::size_t index) const { return groups_.at(index); }
    std::size_t size() const { return groups_.size(); }

    std::size_t group_of(EntityIndex entity) const { return group_of_.at(entity); }
    const std::vector<std::size_t>& successors(std::size_t group) const { return successors_.at(group); }
    const std::vector<std::size_t>& predecessors(std::size_t group) const { return predecessors_.at(group); }

    std::size_t cyclic_count() const;
    std::size_t edge_count() const;

    // Entity ids of every member, in member order.
    std::vector<std::string> member_ids(std::size_t group) const;

private:
    const DependencyGraph* graph_;
    std::vector<Group> groups_;
    std::vector<std::size_t> group_of_;
    std::vector<std::vector<std::size_t>> successors_;
    std::vector<std::vector<std::size_t>> predecessors_;
};

// Tarjan's SCC over the dependency graph. Iterative, so recursion depth
// never depends on the input. Throws InvariantViolation if the condensation
// is not acyclic.
CondensedGraph resolve_cycles(const DependencyGraph& graph);

// Throws InvariantViolation (acyclic-condensation) on any group-level cycle.
void verify_acyclic(const CondensedGraph& condensed);

} // namespace code_atlas
