#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/extractors/language.hpp"

namespace code_atlas {

using EntityIndex = std::uint32_t;

enum class EntityKind { File, Class, Function, Method };
enum class RelationKind { Import, Call, Inherit, Reference };

std::string_view to_string(EntityKind kind);
std::string_view to_string(RelationKind kind);
std::optional<EntityKind> entity_kind_from_string(std::string_view name);
std::optional<RelationKind> relation_kind_from_string(std::string_view name);

struct SourceSpan {
    std::uint32_t start_byte = 0;
    std::uint32_t end_byte = 0;
    std::uint32_t start_line = 1;
    std::uint32_t end_line = 1;

    bool contains(const SourceSpan& other) const {
        return start_byte <= other.start_byte && other.end_byte <= end_byte;
    }
    std::uint32_t length() const { return end_byte - start_byte; }
};

struct Entity {
    std::string id;
    std::string name;
    std::string qualified_name;
    EntityKind kind = EntityKind::File;
    Language language = Language::Python;
    std::string file_path;
    SourceSpan span;
    std::vector<std::string> parameters;
    std::string source_text;
    std::size_t token_count = 0;
    std::uint32_t declaration_order = 0;

    nlohmann::json to_json() const;
    static Entity from_json(const nlohmann::json& j);
};

// Resolved edge inside a DependencyGraph. Endpoints index the graph's entity arena.
struct Relation {
    EntityIndex from = 0;
    EntityIndex to = 0;
    RelationKind kind = RelationKind::Call;

    bool operator==(const Relation& o) const { return from == o.from && to == o.to && kind == o.kind; }
    bool operator<(const Relation& o) const {
        if (from != o.from) return from < o.from;
        if (to != o.to) return to < o.to;
        return kind < o.kind;
    }
};

// Extractor output: source is local to the file, target is still a name.
struct SymbolicRelation {
    std::size_t from_local = 0;
    std::string target;
    RelationKind kind = RelationKind::Call;
};

struct ParseFailure {
    std::string path;
    std::string reason;
};

// Everything one file contributes before merging.
struct FileExtraction {
    std::string path;
    Language language = Language::Python;
    std::vector<Entity> entities; // entities[0] is the file entity
    std::vector<SymbolicRelation> relations;
};

} // namespace code_atlas
