#include "code_atlas/clustering_engine.hpp"
#include "code_atlas/graph_builder.hpp"
#include "code_atlas/sequencer.hpp"
#include <algorithm>
#include <map>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

std::size_t total_tokens(const CondensedGraph& condensed, const std::vector<std::size_t>& groups) {
    std::size_t total = 0;
    for (std::size_t g : groups) total += condensed.group(g).token_count;
    return total;
}

} // namespace

std::size_t ClusteringEngine::bucket_budget(std::size_t total, int depth) const {
    const std::size_t here = config_.level_capacity(depth);
    const std::size_t next = config_.level_capacity(depth + 1);
    // A set that fits this level but not a leaf is cut into leaf-sized pieces
    const std::size_t target = total <= here ? config_.max_token_per_leaf_module : here;
    return std::min(next, target);
}

std::vector<std::vector<std::size_t>> ClusteringEngine::pack(const CondensedGraph& condensed,
                                                             const std::vector<std::size_t>& groups,
                                                             std::size_t budget) const {
    const DependencyGraph& graph = condensed.graph();
    auto directory = [&](std::size_t g) {
        return parent_directory(graph.entity(condensed.group(g).first()).file_path);
    };

    std::vector<std::vector<std::size_t>> buckets;
    std::vector<bool> placed(groups.size(), false);
    std::vector<std::size_t> open;
    std::size_t open_tokens = 0;
    std::map<std::string, std::size_t> open_dirs;

    auto place = [&](std::size_t i) {
        std::size_t g = groups[i];
        open.push_back(g);
        open_tokens += condensed.group(g).token_count;
        ++open_dirs[directory(g)];
        placed[i] = true;
    };

    auto close = [&]() {
        if (open.empty()) return;
        buckets.push_back(std::move(open));
        open.clear();
        open_tokens = 0;
        open_dirs.clear();
    };

    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (placed[i]) continue;
        std::size_t tokens = condensed.group(groups[i]).token_count;

        if (!open.empty() && open_tokens + tokens > budget) {
            // Affinity fill: pull nearby groups from the bucket's dominant directory
            auto dominant = std::max_element(open_dirs.begin(), open_dirs.end(),
                                             [](const auto& a, const auto& b) { return a.second < b.second; });
            const std::string dir = dominant->first;
            std::size_t end = std::min(groups.size(), i + 1 + config_.affinity_lookahead);
            for (std::size_t j = i + 1; j < end; ++j) {
                if (placed[j]) continue;
                std::size_t t = condensed.group(groups[j]).token_count;
                if (open_tokens + t <= budget && directory(groups[j]) == dir) place(j);
            }
            close();
        }
        place(i);
    }
    close();
    return buckets;
}

ClusterNode ClusteringEngine::build(const CondensedGraph& condensed, const std::vector<std::size_t>& position,
                                    std::vector<std::size_t> groups, int depth) const {
    std::sort(groups.begin(), groups.end(),
              [&](std::size_t a, std::size_t b) { return position[a] < position[b]; });

    ClusterNode node;
    node.depth = depth;
    node.token_count = total_tokens(condensed, groups);

    const std::size_t leaf_budget = config_.max_token_per_leaf_module;
    const bool fits = node.token_count <= std::min(config_.level_capacity(depth), leaf_budget);

    if (depth >= config_.max_depth || groups.size() <= 1 || fits) {
        node.groups = std::move(groups);
        node.oversized = node.token_count > leaf_budget;
        if (node.oversized) {
            std::string ids;
            for (std::size_t g : node.groups) {
                for (const auto& id : condensed.member_ids(g)) ids += (ids.empty() ? "" : ", ") + id;
            }
            spdlog::warn("Oversized leaf at depth {}: {} tokens exceed the leaf budget of {} ({})",
                         depth, node.token_count, leaf_budget, ids);
        }
        return node;
    }

    auto buckets = pack(condensed, groups, bucket_budget(node.token_count, depth));
    node.children.resize(buckets.size());

    const long count = static_cast<long>(buckets.size());
    if (config_.parallel_clustering && depth == 0 && count > 1) {
        // Each iteration writes only its own slot
        #pragma omp parallel for schedule(dynamic)
        for (long k = 0; k < count; ++k) {
            auto idx = static_cast<std::size_t>(k);
            node.children[idx] = build(condensed, position, buckets[idx], depth + 1);
        }
    } else {
        for (std::size_t k = 0; k < buckets.size(); ++k) {
            node.children[k] = build(condensed, position, std::move(buckets[k]), depth + 1);
        }
    }
    return node;
}

ClusterNode ClusteringEngine::cluster(const CondensedGraph& condensed, const std::vector<std::size_t>& order) const {
    auto position = order_positions(order, condensed.size());
    ClusterNode root = build(condensed, position, order, 0);
    spdlog::debug("Clustered {} groups into a tree ({} top-level children)", condensed.size(), root.children.size());
    return root;
}

} // namespace code_atlas
