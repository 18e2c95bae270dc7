#include "code_atlas/code_graph.hpp"
#include <algorithm>
#include <stdexcept>

namespace code_atlas {

using json = nlohmann::json;

EntityIndex DependencyGraph::add_entity(Entity entity) {
    auto index = static_cast<EntityIndex>(entities_.size());
    auto [it, inserted] = id_index_.emplace(entity.id, index);
    if (!inserted) throw std::invalid_argument("duplicate entity id: " + entity.id);

    entities_.push_back(std::move(entity));
    adjacency_.emplace_back();
    return index;
}

void DependencyGraph::add_relation(EntityIndex from, EntityIndex to, RelationKind kind) {
    if (from >= entities_.size() || to >= entities_.size()) {
        throw std::out_of_range("relation endpoint outside the entity arena");
    }
    if (from == to) return;
    relations_.push_back({from, to, kind});
    adjacency_[from].push_back(to);
}

void DependencyGraph::finalize() {
    std::sort(relations_.begin(), relations_.end());
    relations_.erase(std::unique(relations_.begin(), relations_.end()), relations_.end());

    for (auto& out : adjacency_) {
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
    }
}

std::optional<EntityIndex> DependencyGraph::find(std::string_view id) const {
    auto it = id_index_.find(std::string(id));
    if (it == id_index_.end()) return std::nullopt;
    return it->second;
}

std::size_t DependencyGraph::total_tokens() const {
    std::size_t total = 0;
    for (const auto& e : entities_) total += e.token_count;
    return total;
}

json DependencyGraph::components_json() const {
    std::vector<json> outgoing(entities_.size());
    for (auto& o : outgoing) {
        o = json{{"import", json::array()}, {"call", json::array()},
                 {"inherit", json::array()}, {"reference", json::array()}};
    }
    // relations_ is sorted by source, so each list comes out ordered
    for (const auto& r : relations_) {
        outgoing[r.from][std::string(to_string(r.kind))].push_back(entities_[r.to].id);
    }

    json out = json::array();
    for (std::size_t i = 0; i < entities_.size(); ++i) {
        json j = entities_[i].to_json();
        j["relations"] = std::move(outgoing[i]);
        out.push_back(std::move(j));
    }
    return out;
}

} // namespace code_atlas
