#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/entity.hpp"

namespace code_atlas {

// Flat arena of entities plus resolved relations. Entities are addressed by
// EntityIndex; no entity holds a pointer to another.
class DependencyGraph {
public:
    // Throws std::invalid_argument on a duplicate id.
    EntityIndex add_entity(Entity entity);

    // Self edges are ignored. Throws std::out_of_range for unknown endpoints.
    void add_relation(EntityIndex from, EntityIndex to, RelationKind kind);

    // Sorts and deduplicates relations and adjacency.
    void finalize();

    std::size_t size() const { return entities_.size(); }
    bool empty() const { return entities_.empty(); }

    const std::vector<Entity>& entities() const { return entities_; }
    const Entity& entity(EntityIndex index) const { return entities_.at(index); }
    std::optional<EntityIndex> find(std::string_view id) const;

    const std::vector<Relation>& relations() const { return relations_; }

    // Distinct targets of outgoing edges, any kind
    const std::vector<EntityIndex>& successors(EntityIndex index) const { return adjacency_.at(index); }

    std::size_t total_tokens() const;

    // Per-entity records with outgoing relations grouped by kind.
    nlohmann::json components_json() const;

private:
    std::vector<Entity> entities_;
    std::unordered_map<std::string, EntityIndex> id_index_;
    std::vector<Relation> relations_;
    std::vector<std::vector<EntityIndex>> adjacency_;
};

} // namespace code_atlas
