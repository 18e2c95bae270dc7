#include "code_atlas/sequencer.hpp"
#include "code_atlas/errors.hpp"
#include <functional>
#include <queue>
#include <string>
#include <tuple>

namespace code_atlas {

std::vector<std::size_t> topological_order(const CondensedGraph& condensed) {
    const std::size_t n = condensed.size();
    const DependencyGraph& graph = condensed.graph();

    auto before = [&](std::size_t a, std::size_t b) {
        const Entity& ea = graph.entity(condensed.group(a).first());
        const Entity& eb = graph.entity(condensed.group(b).first());
        return std::tie(ea.file_path, ea.declaration_order, a) < std::tie(eb.file_path, eb.declaration_order, b);
    };
    // priority_queue pops the largest, so invert the comparison
    auto later = [&](std::size_t a, std::size_t b) { return before(b, a); };
    std::priority_queue<std::size_t, std::vector<std::size_t>, decltype(later)> ready(later);

    std::vector<std::size_t> indegree(n, 0);
    for (std::size_t g = 0; g < n; ++g) {
        for (std::size_t h : condensed.successors(g)) ++indegree[h];
    }
    for (std::size_t g = 0; g < n; ++g) {
        if (indegree[g] == 0) ready.push(g);
    }

    std::vector<std::size_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        std::size_t g = ready.top();
        ready.pop();
        order.push_back(g);
        for (std::size_t h : condensed.successors(g)) {
            if (--indegree[h] == 0) ready.push(h);
        }
    }

    if (order.size() != n) {
        throw InvariantViolation(invariant::kTopologicalOrder,
                                 "emitted " + std::to_string(order.size()) + " of " + std::to_string(n) + " groups");
    }
    return order;
}

std::vector<std::size_t> order_positions(const std::vector<std::size_t>& order, std::size_t group_count) {
    std::vector<std::size_t> position(group_count, 0);
    for (std::size_t i = 0; i < order.size(); ++i) position[order[i]] = i;
    return position;
}

} // namespace code_atlas
