#include "code_atlas/entity.hpp"
#include <array>
#include <utility>

namespace code_atlas {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<EntityKind, std::string_view>, 4> kEntityKinds = {{
    {EntityKind::File, "file"},
    {EntityKind::Class, "class"},
    {EntityKind::Function, "function"},
    {EntityKind::Method, "method"},
}};

constexpr std::array<std::pair<RelationKind, std::string_view>, 4> kRelationKinds = {{
    {RelationKind::Import, "import"},
    {RelationKind::Call, "call"},
    {RelationKind::Inherit, "inherit"},
    {RelationKind::Reference, "reference"},
}};

} // namespace

std::string_view to_string(EntityKind kind) {
    for (const auto& [k, name] : kEntityKinds) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::string_view to_string(RelationKind kind) {
    for (const auto& [k, name] : kRelationKinds) {
        if (k == kind) return name;
    }
    return "unknown";
}

std::optional<EntityKind> entity_kind_from_string(std::string_view name) {
    for (const auto& [k, n] : kEntityKinds) {
        if (n == name) return k;
    }
    return std::nullopt;
}

std::optional<RelationKind> relation_kind_from_string(std::string_view name) {
    for (const auto& [k, n] : kRelationKinds) {
        if (n == name) return k;
    }
    return std::nullopt;
}

json Entity::to_json() const {
    return json{
        {"id", id},
        {"name", name},
        {"qualified_name", qualified_name},
        {"kind", std::string(to_string(kind))},
        {"language", std::string(to_string(language))},
        {"file_path", file_path},
        {"span", {
            {"start_byte", span.start_byte},
            {"end_byte", span.end_byte},
            {"start_line", span.start_line},
            {"end_line", span.end_line}
        }},
        {"parameters", parameters},
        {"token_count", token_count},
        {"declaration_order", declaration_order},
        {"source_text", source_text}
    };
}

Entity Entity::from_json(const json& j) {
    Entity e;
    e.id = j.value("id", "");
    e.name = j.value("name", "");
    e.qualified_name = j.value("qualified_name", "");
    e.kind = entity_kind_from_string(j.value("kind", "file")).value_or(EntityKind::File);
    e.language = language_from_name(j.value("language", "python")).value_or(Language::Python);
    e.file_path = j.value("file_path", "");
    if (j.contains("span")) {
        const auto& s = j.at("span");
        e.span.start_byte = s.value("start_byte", 0u);
        e.span.end_byte = s.value("end_byte", 0u);
        e.span.start_line = s.value("start_line", 1u);
        e.span.end_line = s.value("end_line", 1u);
    }
    if (j.contains("parameters")) e.parameters = j.at("parameters").get<std::vector<std::string>>();
    e.token_count = j.value("token_count", std::size_t{0});
    e.declaration_order = j.value("declaration_order", 0u);
    e.source_text = j.value("source_text", "");
    return e;
}

} // namespace code_atlas
