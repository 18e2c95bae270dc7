#pragma once
#include <cstddef>
#include <vector>
#include "code_atlas/cycle_resolver.hpp"

namespace code_atlas {

// Kahn's algorithm over the condensed DAG. Among ready groups the one whose
// first member has the smallest (file path, declaration order) goes first,
// so the order never depends on container iteration.
// Throws InvariantViolation (topological-order) if some group is never emitted.
std::vector<std::size_t> topological_order(const CondensedGraph& condensed);

// position[g] = index of group g in `order`.
std::vector<std::size_t> order_positions(const std::vector<std::size_t>& order, std::size_t group_count);

} // namespace code_atlas
