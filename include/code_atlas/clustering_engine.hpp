#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "code_atlas/config.hpp"
#include "code_atlas/cycle_resolver.hpp"

namespace code_atlas {

// Intermediate cluster structure; the assembler turns it into Modules.
struct ClusterNode {
    int depth = 0;
    std::size_t token_count = 0;
    std::vector<std::size_t> groups;       // leaves only, in sequence order
    std::vector<ClusterNode> children;
    bool oversized = false;

    bool leaf() const { return children.empty(); }
};

class ClusteringEngine {
public:
    explicit ClusteringEngine(const Config& config) : config_(config) {}

    // `order` is a topological order of every group in `condensed`.
    ClusterNode cluster(const CondensedGraph& condensed, const std::vector<std::size_t>& order) const;

    // Splits `groups` (sequence order) into buckets of at most `budget` tokens.
    // A group larger than the budget gets a bucket of its own; groups are never split.
    std::vector<std::vector<std::size_t>> pack(const CondensedGraph& condensed,
                                               const std::vector<std::size_t>& groups,
                                               std::size_t budget) const;

private:
    ClusterNode build(const CondensedGraph& condensed, const std::vector<std::size_t>& position,
                      std::vector<std::size_t> groups, int depth) const;

    std::size_t bucket_budget(std::size_t total, int depth) const;

    const Config& config_;
};

} // namespace code_atlas
