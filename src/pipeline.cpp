#include "code_atlas/pipeline.hpp"
#include "code_atlas/clustering_engine.hpp"
#include "code_atlas/file_scanner.hpp"
#include "code_atlas/sequencer.hpp"
#include "code_atlas/tree_assembler.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {

class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace

json PipelineTimings::to_json() const {
    return json{
        {"scan_ms", scan_ms},
        {"extract_ms", extract_ms},
        {"build_ms", build_ms},
        {"condense_ms", condense_ms},
        {"cluster_ms", cluster_ms}
    };
}

PipelineResult Pipeline::run(const fs::path& root) const {
    Stopwatch scan_clock;
    auto files = scan_repository(root, ScanFilter::from_config(config_));
    double scan_ms = scan_clock.elapsed_ms();

    Stopwatch extract_clock;
    CodeParser parser(config_.strict_syntax);
    ExtractionReport report = parser.extract_files(root, files, config_.worker_threads);
    double extract_ms = extract_clock.elapsed_ms();
    spdlog::info("Extracted {} entities and {} relations from {} files in {:.1f} ms ({} failed)",
                 report.entity_count(), report.relation_count(), report.files.size(), extract_ms,
                 report.failures.size());

    PipelineResult result = analyze(std::move(report.files), std::move(report.failures));
    result.files = std::move(files);
    result.timings.scan_ms = scan_ms;
    result.timings.extract_ms = extract_ms;
    return result;
}

PipelineResult Pipeline::analyze(std::vector<FileExtraction> files, std::vector<ParseFailure> failures) const {
    Stopwatch clock;
    GraphBuilder builder(config_);
    DependencyGraph graph = builder.build(std::move(files));
    double build_ms = clock.elapsed_ms();
    spdlog::info("Graph: {} entities, {} relations, {} targets dropped ({:.1f} ms)",
                 graph.size(), graph.relations().size(), builder.stats().total_dropped(), build_ms);

    PipelineResult result = analyze(std::move(graph));
    result.failures = std::move(failures);
    result.resolution = builder.stats();
    result.timings.build_ms = build_ms;
    return result;
}

PipelineResult Pipeline::analyze(DependencyGraph graph) const {
    PipelineResult result;
    result.graph = std::make_shared<const DependencyGraph>(std::move(graph));
    build_tree(result);
    return result;
}

void Pipeline::build_tree(PipelineResult& result) const {
    Stopwatch condense_clock;
    result.condensed = std::make_shared<const CondensedGraph>(resolve_cycles(*result.graph));
    result.order = topological_order(*result.condensed);
    result.timings.condense_ms = condense_clock.elapsed_ms();
    spdlog::info("Condensed into {} groups ({} cyclic), {} group edges ({:.1f} ms)",
                 result.condensed->size(), result.condensed->cyclic_count(), result.condensed->edge_count(),
                 result.timings.condense_ms);

    Stopwatch cluster_clock;
    if (auto saved = load_saved_grouping(*result.condensed)) {
        result.tree = std::move(saved);
        result.used_saved_grouping = true;
    } else {
        ClusteringEngine engine(config_);
        ClusterNode root = engine.cluster(*result.condensed, result.order);
        TreeAssembler assembler(config_, *result.condensed);
        result.tree = assembler.assemble(root);
    }
    result.timings.cluster_ms = cluster_clock.elapsed_ms();

    spdlog::info("Module tree: {} modules, {} leaves, depth {} ({:.1f} ms)",
                 result.tree->module_count(), result.tree->leaves().size(), result.tree->max_depth(),
                 result.timings.cluster_ms);
}

std::optional<ModuleTree> Pipeline::load_saved_grouping(const CondensedGraph& condensed) const {
    if (config_.saved_grouping.empty()) return std::nullopt;

    try {
        std::ifstream f(config_.saved_grouping);
        if (!f.is_open()) throw std::runtime_error("cannot open file");
        json j = json::parse(f);

        TreeAssembler assembler(config_, condensed);
        ModuleTree tree = assembler.adopt(Module::from_json(j));
        spdlog::info("Using saved grouping {}", config_.saved_grouping);
        return tree;
    } catch (const std::exception& e) {
        // Any mismatch with the current graph falls back to fresh clustering
        spdlog::warn("Saved grouping {} rejected: {}. Clustering instead", config_.saved_grouping, e.what());
        return std::nullopt;
    }
}

} // namespace code_atlas
