#include "code_atlas/artifact_writer.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

json ArtifactWriter::metadata_json(const PipelineResult& result, const fs::path& repo_root) {
    const ModuleTree& tree = *result.tree;

    json failures = json::array();
    for (const auto& f : result.failures) failures.push_back({{"path", f.path}, {"reason", f.reason}});

    json oversized = json::array();
    for (const Module* leaf : tree.leaves()) {
        if (leaf->oversized) oversized.push_back(leaf->module_id);
    }

    return json{
        {"generator", {{"name", kGeneratorName}, {"version", kGeneratorVersion}}},
        {"repo_path", repo_root.generic_string()},
        {"statistics", {
            {"files", result.files.size()},
            {"total_entities", result.graph->size()},
            {"total_relations", result.graph->relations().size()},
            {"total_tokens", result.graph->total_tokens()},
            {"groups", result.condensed->size()},
            {"cyclic_groups", result.condensed->cyclic_count()},
            {"modules", tree.module_count()},
            {"leaf_modules", tree.leaves().size()},
            {"max_depth", tree.max_depth()},
            {"oversized_leaves", oversized},
            {"parse_failures", failures},
            {"resolution", result.resolution.to_json()},
            {"saved_grouping", result.used_saved_grouping}
        }},
        {"processing_order", tree.processing_order()}
    };
}

void ArtifactWriter::write_file(const std::string& name, const std::string& content) const {
    fs::path target = output_dir_ / name;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write " + target.string());
    out << content;
    if (!out) throw std::runtime_error("write failed for " + target.string());
}

void ArtifactWriter::write(const PipelineResult& result, const fs::path& repo_root) const {
    if (!result.tree) throw std::runtime_error("no module tree to write");

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) throw std::runtime_error("cannot create " + output_dir_.string() + ": " + ec.message());

    write_file("module_tree.json", result.tree->dump() + "\n");
    write_file("module_tree.txt", result.tree->render_text());
    // Source text and file system paths are not guaranteed to be valid UTF-8
    write_file("components.json",
               result.graph->components_json().dump(2, ' ', false, json::error_handler_t::replace) + "\n");
    write_file("metadata.json",
               metadata_json(result, repo_root).dump(2, ' ', false, json::error_handler_t::replace) + "\n");

    spdlog::info("Artifacts written to {}", output_dir_.string());
}

} // namespace code_atlas
