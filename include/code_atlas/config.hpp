#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_atlas {

// Immutable once validated; passed by const& into every stage.
struct Config {
    std::size_t max_token_per_module = 36369;
    std::size_t max_token_per_leaf_module = 16000;
    int max_depth = 2;

    std::string repository_name;
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns = {
        ".git", "node_modules", "build", "dist", "vendor", "third_party", "__pycache__"
    };

    int worker_threads = 0;              // 0 = OpenMP default
    bool strict_syntax = false;          // syntax errors count as parse failures
    bool resolve_calls_globally = true;  // allow unique repo-wide name matches
    bool parallel_clustering = true;
    std::size_t affinity_lookahead = 32;
    std::string saved_grouping;          // path to a module tree to reuse
    std::string log_level = "info";

    // Budget that a module at `depth` must fit to stay unsplit.
    std::size_t level_capacity(int depth) const {
        return depth >= max_depth ? max_token_per_leaf_module : max_token_per_module;
    }

    // Throws ConfigurationError.
    void validate() const;

    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

// Reads and validates a JSON config file. Throws ConfigurationError.
Config load_config(const std::string& path);

} // namespace code_atlas
