#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "code_atlas/pipeline.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

inline constexpr const char* kGeneratorName = "code_atlas";
inline constexpr const char* kGeneratorVersion = "0.1.0";

// Writes module_tree.json, module_tree.txt, components.json and metadata.json.
class ArtifactWriter {
public:
    explicit ArtifactWriter(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

    // Throws std::runtime_error when the directory or a file cannot be written.
    void write(const PipelineResult& result, const fs::path& repo_root) const;

    // Run statistics and processing order; contains nothing time-dependent.
    static nlohmann::json metadata_json(const PipelineResult& result, const fs::path& repo_root);

private:
    void write_file(const std::string& name, const std::string& content) const;

    fs::path output_dir_;
};

} // namespace code_atlas
