#include "code_atlas/config.hpp"
#include "code_atlas/errors.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

std::int64_t read_integer(const json& j, const char* key, std::int64_t fallback) {
    if (!j.contains(key)) return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigurationError(std::string("'") + key + "' must be an integer");
    }
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
        throw ConfigurationError(std::string("'") + key + "' is out of range");
    }
    return v.get<std::int64_t>();
}

// Integer in [min, max]; anything outside is rejected rather than narrowed.
std::int64_t read_bounded(const json& j, const char* key, std::int64_t fallback, std::int64_t min, std::int64_t max) {
    std::int64_t v = read_integer(j, key, fallback);
    if (v < min || v > max) {
        throw ConfigurationError(std::string("'") + key + "' must be in [" + std::to_string(min) + ", " +
                                 std::to_string(max) + "], got " + std::to_string(v));
    }
    return v;
}

std::size_t read_positive(const json& j, const char* key, std::size_t fallback) {
    std::int64_t v = read_integer(j, key, static_cast<std::int64_t>(fallback));
    if (v <= 0) {
        throw ConfigurationError(std::string("'") + key + "' must be a positive integer, got " + std::to_string(v));
    }
    return static_cast<std::size_t>(v);
}

std::vector<std::string> read_string_list(const json& j, const char* key, std::vector<std::string> fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    const auto& v = j.at(key);
    if (!v.is_array()) throw ConfigurationError(std::string("'") + key + "' must be a list of strings");

    std::vector<std::string> out;
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!v[i].is_string()) {
            throw ConfigurationError(std::string("'") + key + "[" + std::to_string(i) + "]' must be a string");
        }
        out.push_back(v[i].get<std::string>());
    }
    return out;
}

std::string read_string(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    if (!j.at(key).is_string()) throw ConfigurationError(std::string("'") + key + "' must be a string");
    return j.at(key).get<std::string>();
}

bool read_bool(const json& j, const char* key, bool fallback) {
    if (!j.contains(key)) return fallback;
    if (!j.at(key).is_boolean()) throw ConfigurationError(std::string("'") + key + "' must be a boolean");
    return j.at(key).get<bool>();
}

} // namespace

void Config::validate() const {
    if (max_token_per_module == 0) {
        throw ConfigurationError("'max_token_per_module' must be a positive integer");
    }
    if (max_token_per_leaf_module == 0) {
        throw ConfigurationError("'max_token_per_leaf_module' must be a positive integer");
    }
    if (max_depth < 1) {
        throw ConfigurationError("'max_depth' must be >= 1, got " + std::to_string(max_depth));
    }
    if (worker_threads < 0) {
        throw ConfigurationError("'worker_threads' must be >= 0");
    }
    if (std::find_if(kLogLevels.begin(), kLogLevels.end(),
                     [&](const char* l) { return log_level == l; }) == kLogLevels.end()) {
        throw ConfigurationError("unknown 'log_level': " + log_level);
    }
}

json Config::to_json() const {
    return json{
        {"max_token_per_module", max_token_per_module},
        {"max_token_per_leaf_module", max_token_per_leaf_module},
        {"max_depth", max_depth},
        {"repository_name", repository_name},
        {"include_patterns", include_patterns},
        {"exclude_patterns", exclude_patterns},
        {"worker_threads", worker_threads},
        {"strict_syntax", strict_syntax},
        {"resolve_calls_globally", resolve_calls_globally},
        {"parallel_clustering", parallel_clustering},
        {"affinity_lookahead", affinity_lookahead},
        {"saved_grouping", saved_grouping},
        {"log_level", log_level}
    };
}

Config Config::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError(std::string("expected a JSON object at the top level, got ") + j.type_name());
    }

    Config cfg;
    cfg.max_token_per_module = read_positive(j, "max_token_per_module", cfg.max_token_per_module);
    cfg.max_token_per_leaf_module = read_positive(j, "max_token_per_leaf_module", cfg.max_token_per_leaf_module);

    constexpr std::int64_t kIntMax = std::numeric_limits<int>::max();
    cfg.max_depth = static_cast<int>(read_bounded(j, "max_depth", cfg.max_depth, 1, kIntMax));

    cfg.repository_name = read_string(j, "repository_name", cfg.repository_name);
    cfg.include_patterns = read_string_list(j, "include_patterns", cfg.include_patterns);
    cfg.exclude_patterns = read_string_list(j, "exclude_patterns", cfg.exclude_patterns);
    cfg.worker_threads = static_cast<int>(read_bounded(j, "worker_threads", cfg.worker_threads, 0, kIntMax));
    cfg.strict_syntax = read_bool(j, "strict_syntax", cfg.strict_syntax);
    cfg.resolve_calls_globally = read_bool(j, "resolve_calls_globally", cfg.resolve_calls_globally);
    cfg.parallel_clustering = read_bool(j, "parallel_clustering", cfg.parallel_clustering);
    cfg.affinity_lookahead = static_cast<std::size_t>(
        read_bounded(j, "affinity_lookahead", static_cast<std::int64_t>(cfg.affinity_lookahead), 0, INT64_MAX));
    cfg.saved_grouping = read_string(j, "saved_grouping", cfg.saved_grouping);
    cfg.log_level = read_string(j, "log_level", cfg.log_level);

    cfg.validate();
    return cfg;
}

Config load_config(const std::string& path) {
    if (!fs::exists(path)) throw ConfigurationError("config file not found: " + path);

    std::ifstream f(path);
    if (!f.is_open()) throw ConfigurationError("cannot open config file: " + path);

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("config file '" + path + "' is not valid JSON: " + e.what());
    }

    Config cfg = Config::from_json(j);
    spdlog::debug("Loaded config {} (module budget {}, leaf budget {}, max depth {})",
                  path, cfg.max_token_per_module, cfg.max_token_per_leaf_module, cfg.max_depth);
    return cfg;
}

} // namespace code_atlas
