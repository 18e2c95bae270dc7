#include "code_atlas/extractors/tree_walker.hpp"
#include "code_atlas/token_counter.hpp"
#include <cctype>

namespace code_atlas::extract {

bool contains(const std::vector<std::string_view>& list, std::string_view type) {
    return std::find(list.begin(), list.end(), type) != list.end();
}

std::string qualify(std::string_view prefix, std::string_view name) {
    if (prefix.empty()) return std::string(name);
    if (name.empty()) return std::string(prefix);
    std::string out;
    out.reserve(prefix.size() + name.size() + 1);
    out.append(prefix).append(".").append(name);
    return out;
}

std::string normalize_symbol(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == ':' && i + 1 < name.size() && name[i + 1] == ':') {
            out.push_back('.');
            ++i;
        } else if (c == '-' && i + 1 < name.size() && name[i + 1] == '>') {
            out.push_back('.');
            ++i;
        } else if (c == '\\' || c == '/') {
            out.push_back('.');
        } else {
            out.push_back(c);
        }
    }
    // Leading separators come from global qualifiers like ::foo or \App\Foo
    std::size_t first = out.find_first_not_of('.');
    if (first == std::string::npos) return {};
    return out.substr(first);
}

void assign_exclusive_tokens(std::vector<Entity>& entities, const std::vector<long>& parents,
                             std::string_view source) {
    std::vector<std::vector<std::size_t>> children(entities.size());
    for (std::size_t i = 1; i < entities.size(); ++i) {
        long p = parents[i];
        if (p >= 0) children[static_cast<std::size_t>(p)].push_back(i);
    }

    for (std::size_t i = 0; i < entities.size(); ++i) {
        const SourceSpan& span = entities[i].span;
        std::size_t tokens = 0;
        std::uint32_t cursor = span.start_byte;

        // Children are already in source order
        for (std::size_t c : children[i]) {
            const SourceSpan& cs = entities[c].span;
            if (cs.start_byte > cursor) tokens += estimate_tokens(source.substr(cursor, cs.start_byte - cursor));
            cursor = std::max(cursor, cs.end_byte);
        }
        if (span.end_byte > cursor && cursor < source.size()) {
            tokens += estimate_tokens(source.substr(cursor, span.end_byte - cursor));
        }
        entities[i].token_count = tokens;
    }
}

} // namespace code_atlas::extract
