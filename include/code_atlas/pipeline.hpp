#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/code_parser.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/cycle_resolver.hpp"
#include "code_atlas/graph_builder.hpp"
#include "code_atlas/module_tree.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

struct PipelineTimings {
    double scan_ms = 0;
    double extract_ms = 0;
    double build_ms = 0;
    double condense_ms = 0;
    double cluster_ms = 0;

    nlohmann::json to_json() const;
};

struct PipelineResult {
    std::vector<std::string> files;
    std::vector<ParseFailure> failures;
    ResolutionStats resolution;
    std::shared_ptr<const DependencyGraph> graph;
    std::shared_ptr<const CondensedGraph> condensed;   // refers to *graph
    std::vector<std::size_t> order;
    std::optional<ModuleTree> tree;
    bool used_saved_grouping = false;
    PipelineTimings timings;
};

// scan -> extract -> build graph -> condense -> sequence -> cluster -> assemble.
class Pipeline {
public:
    explicit Pipeline(const Config& config) : config_(config) {}

    // Whole run over a repository on disk.
    PipelineResult run(const fs::path& root) const;

    // From already extracted files onward.
    PipelineResult analyze(std::vector<FileExtraction> files, std::vector<ParseFailure> failures = {}) const;

    // From a finished graph onward.
    PipelineResult analyze(DependencyGraph graph) const;

private:
    void build_tree(PipelineResult& result) const;
    std::optional<ModuleTree> load_saved_grouping(const CondensedGraph& condensed) const;

    const Config& config_;
};

} // namespace code_atlas
