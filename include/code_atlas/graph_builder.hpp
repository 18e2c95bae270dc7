#pragma once
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/entity.hpp"

namespace code_atlas {

struct ResolutionStats {
    std::array<std::size_t, 4> resolved{};  // indexed by RelationKind
    std::array<std::size_t, 4> dropped{};

    std::size_t total_resolved() const;
    std::size_t total_dropped() const;
    nlohmann::json to_json() const;
};

// Merges per-file extractions into one DependencyGraph and resolves symbolic
// targets against the whole repository. Unresolvable targets are dropped.
class GraphBuilder {
public:
    explicit GraphBuilder(const Config& config) : config_(config) {}

    DependencyGraph build(std::vector<FileExtraction> files);

    const ResolutionStats& stats() const { return stats_; }

private:
    struct FileInfo {
        std::string path;
        Language language = Language::Python;
        std::vector<EntityIndex> local_to_global;
    };

    void index_entities(const DependencyGraph& graph);

    std::optional<EntityIndex> resolve_import(const DependencyGraph& graph, const FileInfo& file,
                                              const std::string& target) const;
    std::optional<EntityIndex> resolve_symbol(const DependencyGraph& graph, const FileInfo& file,
                                              EntityIndex source, const std::string& target,
                                              RelationKind kind,
                                              const std::set<std::string>& imported_files) const;

    std::optional<EntityIndex> match_path(const std::string& importer, const std::string& candidate) const;
    std::vector<std::string> import_candidates(const FileInfo& file, const std::string& target) const;

    const Config& config_;
    ResolutionStats stats_;

    std::map<std::string, EntityIndex> file_index_;                       // path -> file entity
    std::map<std::string, std::vector<std::string>> basename_index_;     // file name -> paths
    std::map<std::string, std::vector<EntityIndex>> symbol_index_;       // simple name -> symbols, index order
};

// Lexically joins `relative` onto directory `base` ('/' separated). Returns
// an empty string when the result would climb above the repository root.
std::string join_relative(const std::string& base, const std::string& relative);

std::string parent_directory(const std::string& path);

} // namespace code_atlas
