#include "code_atlas/cycle_resolver.hpp"
#include "code_atlas/errors.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

std::vector<std::vector<EntityIndex>> tarjan(const DependencyGraph& graph) {
    const std::size_t n = graph.size();
    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<EntityIndex> stack;
    std::vector<std::vector<EntityIndex>> components;

    struct Frame {
        EntityIndex node;
        std::size_t next;
    };
    std::vector<Frame> frames;
    std::size_t counter = 0;

    for (EntityIndex start = 0; start < n; ++start) {
        if (index[start] != kUnvisited) continue;

        index[start] = low[start] = counter++;
        stack.push_back(start);
        on_stack[start] = true;
        frames.push_back({start, 0});

        while (!frames.empty()) {
            EntityIndex v = frames.back().node;
            const auto& out = graph.successors(v);

            if (frames.back().next < out.size()) {
                EntityIndex w = out[frames.back().next++];
                if (index[w] == kUnvisited) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    frames.push_back({w, 0});
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], index[w]);
                }
                continue;
            }

            frames.pop_back();
            if (!frames.empty()) {
                EntityIndex parent = frames.back().node;
                low[parent] = std::min(low[parent], low[v]);
            }

            if (low[v] == index[v]) {
                std::vector<EntityIndex> component;
                EntityIndex w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end());
                components.push_back(std::move(component));
            }
        }
    }
    return components;
}

} // namespace

CondensedGraph::CondensedGraph(const DependencyGraph& graph, std::vector<Group> groups,
                               std::vector<std::size_t> group_of)
    : graph_(&graph), groups_(std::move(groups)), group_of_(std::move(group_of)),
      successors_(groups_.size()), predecessors_(groups_.size()) {
    for (const auto& r : graph.relations()) {
        std::size_t a = group_of_.at(r.from);
        std::size_t b = group_of_.at(r.to);
        if (a != b) successors_[a].push_back(b);
    }
    for (std::size_t g = 0; g < successors_.size(); ++g) {
        auto& out = successors_[g];
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        for (std::size_t h : out) predecessors_[h].push_back(g);
    }
}

std::size_t CondensedGraph::cyclic_count() const {
    return static_cast<std::size_t>(std::count_if(groups_.begin(), groups_.end(),
                                                  [](const Group& g) { return g.cyclic(); }));
}

std::size_t CondensedGraph::edge_count() const {
    std::size_t n = 0;
    for (const auto& out : successors_) n += out.size();
    return n;
}

std::vector<std::string> CondensedGraph::member_ids(std::size_t group) const {
    std::vector<std::string> ids;
    for (EntityIndex e : groups_.at(group).members) ids.push_back(graph_->entity(e).id);
    return ids;
}

CondensedGraph resolve_cycles(const DependencyGraph& graph) {
    auto components = tarjan(graph);

    // Order groups by first member so numbering does not depend on traversal
    std::sort(components.begin(), components.end(),
              [](const auto& a, const auto& b) { return a.front() < b.front(); });

    std::vector<Group> groups;
    std::vector<std::size_t> group_of(graph.size(), 0);
    groups.reserve(components.size());

    for (auto& members : components) {
        Group g;
        const Entity& head = graph.entity(members.front());
        g.id = members.size() == 1 ? head.id : "scc:" + head.id;
        for (EntityIndex m : members) {
            g.token_count += graph.entity(m).token_count;
            group_of[m] = groups.size();
        }
        if (members.size() > 1) {
            spdlog::debug("Cycle group {} with {} members ({} tokens)", g.id, members.size(), g.token_count);
        }
        g.members = std::move(members);
        groups.push_back(std::move(g));
    }

    CondensedGraph condensed(graph, std::move(groups), std::move(group_of));
    verify_acyclic(condensed);
    return condensed;
}

void verify_acyclic(const CondensedGraph& condensed) {
    const std::size_t n = condensed.size();
    std::vector<std::size_t> indegree(n, 0);
    for (std::size_t g = 0; g < n; ++g) {
        for (std::size_t h : condensed.successors(g)) {
            if (h == g) throw InvariantViolation(invariant::kAcyclic, "group " + condensed.group(g).id + " has a self edge");
            ++indegree[h];
        }
    }

    std::vector<std::size_t> ready;
    for (std::size_t g = 0; g < n; ++g) {
        if (indegree[g] == 0) ready.push_back(g);
    }
    std::size_t visited = 0;
    while (!ready.empty()) {
        std::size_t g = ready.back();
        ready.pop_back();
        ++visited;
        for (std::size_t h : condensed.successors(g)) {
            if (--indegree[h] == 0) ready.push_back(h);
        }
    }
    if (visited != n) {
        throw InvariantViolation(invariant::kAcyclic,
                                 std::to_string(n - visited) + " groups remain on a cycle after condensation");
    }
}

} // namespace code_atlas
