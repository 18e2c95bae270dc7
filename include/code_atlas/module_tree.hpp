#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_atlas {

struct Module {
    std::string module_id;
    std::string name;
    std::string path;                      // longest common directory of its entities
    bool leaf = true;
    std::size_t token_count = 0;           // recursive
    int depth = 0;
    bool oversized = false;
    bool complex = false;                  // entities span more than one file
    std::vector<std::string> entity_ids;   // leaves only
    std::vector<Module> children;

    nlohmann::ordered_json to_json() const;

    // Throws std::invalid_argument when a required field is missing or mistyped.
    static Module from_json(const nlohmann::json& j);
};

// Immutable once built. Copies share the same underlying tree.
class ModuleTree {
public:
    explicit ModuleTree(Module root);

    const Module& root() const { return *root_; }

    // Post-order: children before their parent.
    std::vector<std::string> processing_order() const;

    std::vector<const Module*> leaves() const;
    const Module* leaf_of(std::string_view entity_id) const;
    const Module* find(std::string_view module_id) const;

    std::size_t module_count() const;
    int max_depth() const;

    // Box-drawing outline, one module per line.
    std::string render_text() const;

    nlohmann::ordered_json to_json() const { return root_->to_json(); }
    std::string dump() const;

private:
    std::shared_ptr<const Module> root_;
    std::shared_ptr<const std::unordered_map<std::string, const Module*>> leaf_index_;
};

} // namespace code_atlas
