#include "code_atlas/graph_builder.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t end = s.find(sep, start);
        if (end == std::string_view::npos) end = s.size();
        if (end > start) parts.emplace_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

// Number of leading directory components two file paths share.
std::size_t shared_directory_depth(const std::string& a, const std::string& b) {
    auto da = split(parent_directory(a), '/');
    auto db = split(parent_directory(b), '/');
    std::size_t n = 0;
    while (n < da.size() && n < db.size() && da[n] == db[n]) ++n;
    return n;
}

// Leading dot-components two qualified names share.
std::size_t shared_scope_depth(const std::string& a, const std::string& b) {
    auto sa = split(a, '.');
    auto sb = split(b, '.');
    std::size_t n = 0;
    while (n < sa.size() && n < sb.size() && sa[n] == sb[n]) ++n;
    return n;
}

std::string dotted_to_path(std::string_view dotted) {
    std::string out(dotted);
    std::replace(out.begin(), out.end(), '.', '/');
    return out;
}

std::string last_component(const std::string& target) {
    std::string t = target;
    std::replace(t.begin(), t.end(), '\\', '/');
    std::replace(t.begin(), t.end(), '.', '/');
    auto parts = split(t, '/');
    return parts.empty() ? std::string{} : parts.back();
}

constexpr std::array<const char*, 7> kScriptExtensions = {".ts", ".tsx", ".d.ts", ".js", ".jsx", ".mjs", ".cjs"};

void script_candidates(const std::string& base, std::vector<std::string>& out) {
    out.push_back(base);
    for (const char* ext : kScriptExtensions) out.push_back(base + ext);
    for (const char* ext : kScriptExtensions) out.push_back(base + "/index" + ext);
    // ESM TypeScript imports name the emitted .js file
    if (ends_with(base, ".js")) {
        std::string stem = base.substr(0, base.size() - 3);
        out.push_back(stem + ".ts");
        out.push_back(stem + ".tsx");
    }
}

} // namespace

std::string parent_directory(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? std::string{} : path.substr(0, slash);
}

std::string join_relative(const std::string& base, const std::string& relative) {
    std::vector<std::string> stack = split(base, '/');
    for (const auto& part : split(relative, '/')) {
        if (part == ".") continue;
        if (part == "..") {
            if (stack.empty()) return {};
            stack.pop_back();
            continue;
        }
        stack.push_back(part);
    }
    std::string out;
    for (const auto& part : stack) {
        if (!out.empty()) out += '/';
        out += part;
    }
    return out;
}

std::size_t ResolutionStats::total_resolved() const {
    std::size_t n = 0;
    for (auto v : resolved) n += v;
    return n;
}

std::size_t ResolutionStats::total_dropped() const {
    std::size_t n = 0;
    for (auto v : dropped) n += v;
    return n;
}

json ResolutionStats::to_json() const {
    json resolved_j = json::object();
    json dropped_j = json::object();
    for (RelationKind kind : {RelationKind::Import, RelationKind::Call, RelationKind::Inherit, RelationKind::Reference}) {
        auto k = static_cast<std::size_t>(kind);
        resolved_j[std::string(to_string(kind))] = resolved[k];
        dropped_j[std::string(to_string(kind))] = dropped[k];
    }
    return json{{"resolved", resolved_j}, {"dropped", dropped_j}};
}

DependencyGraph GraphBuilder::build(std::vector<FileExtraction> files) {
    stats_ = ResolutionStats{};
    file_index_.clear();
    basename_index_.clear();
    symbol_index_.clear();

    std::sort(files.begin(), files.end(),
              [](const FileExtraction& a, const FileExtraction& b) { return a.path < b.path; });

    DependencyGraph graph;
    std::vector<FileInfo> infos;
    std::vector<const FileExtraction*> sources;
    infos.reserve(files.size());

    for (auto& file : files) {
        if (!infos.empty() && infos.back().path == file.path) {
            spdlog::warn("Duplicate extraction for {}, keeping the first", file.path);
            continue;
        }
        FileInfo info;
        info.path = file.path;
        info.language = file.language;

        // Overloads share a qualified name; later ones get #2, #3, ...
        std::map<std::string, int> seen;
        for (auto& entity : file.entities) {
            if (entity.kind != EntityKind::File) {
                int n = ++seen[entity.id];
                if (n > 1) entity.id += "#" + std::to_string(n);
            }
            info.local_to_global.push_back(graph.add_entity(std::move(entity)));
        }
        infos.push_back(std::move(info));
        sources.push_back(&file);
    }

    index_entities(graph);

    auto record = [&](EntityIndex from, std::optional<EntityIndex> to, RelationKind kind) {
        auto k = static_cast<std::size_t>(kind);
        if (!to || *to == from) {
            ++stats_.dropped[k];
            return;
        }
        graph.add_relation(from, *to, kind);
        ++stats_.resolved[k];
    };

    // Imports first: they decide which files a symbol may resolve into
    std::vector<std::set<std::string>> imported(infos.size());
    for (std::size_t f = 0; f < infos.size(); ++f) {
        const FileInfo& info = infos[f];
        for (const auto& rel : sources[f]->relations) {
            if (rel.kind != RelationKind::Import || rel.from_local >= info.local_to_global.size()) continue;
            auto target = resolve_import(graph, info, rel.target);
            if (target) imported[f].insert(graph.entity(*target).file_path);
            record(info.local_to_global[rel.from_local], target, RelationKind::Import);
        }
    }

    for (std::size_t f = 0; f < infos.size(); ++f) {
        const FileInfo& info = infos[f];
        for (const auto& rel : sources[f]->relations) {
            if (rel.kind == RelationKind::Import) continue;
            if (rel.from_local >= info.local_to_global.size()) {
                ++stats_.dropped[static_cast<std::size_t>(rel.kind)];
                continue;
            }
            EntityIndex from = info.local_to_global[rel.from_local];
            record(from, resolve_symbol(graph, info, from, rel.target, rel.kind, imported[f]), rel.kind);
        }
    }

    graph.finalize();
    spdlog::debug("Graph built: {} entities, {} relations ({} targets dropped)",
                  graph.size(), graph.relations().size(), stats_.total_dropped());
    return graph;
}

void GraphBuilder::index_entities(const DependencyGraph& graph) {
    const auto& entities = graph.entities();
    for (std::size_t i = 0; i < entities.size(); ++i) {
        const Entity& e = entities[i];
        auto index = static_cast<EntityIndex>(i);
        if (e.kind == EntityKind::File) {
            file_index_.emplace(e.file_path, index);
            auto slash = e.file_path.find_last_of('/');
            basename_index_[slash == std::string::npos ? e.file_path : e.file_path.substr(slash + 1)]
                .push_back(e.file_path);
        } else {
            symbol_index_[e.name].push_back(index);
        }
    }
}

std::vector<std::string> GraphBuilder::import_candidates(const FileInfo& file, const std::string& target) const {
    std::vector<std::string> out;
    const std::string dir = parent_directory(file.path);

    switch (file.language) {
        case Language::Python: {
            std::size_t dots = 0;
            while (dots < target.size() && target[dots] == '.') ++dots;
            std::string rest = dotted_to_path(target.substr(dots));
            std::string base;
            if (dots > 0) {
                base = dir;
                for (std::size_t k = 1; k < dots; ++k) {
                    if (base.empty()) return out;
                    base = parent_directory(base);
                }
            }
            std::string prefix = base.empty() ? std::string{} : base + "/";
            if (rest.empty()) {
                out.push_back(prefix + "__init__.py");
            } else {
                out.push_back(prefix + rest + ".py");
                out.push_back(prefix + rest + "/__init__.py");
            }
            break;
        }
        case Language::Java: {
            std::string path = dotted_to_path(target);
            out.push_back(path + ".java");
            // static imports and nested classes name a member of the file's class
            std::string outer = parent_directory(path);
            if (!outer.empty()) out.push_back(outer + ".java");
            break;
        }
        case Language::JavaScript:
        case Language::TypeScript: {
            if (starts_with(target, ".")) {
                std::string joined = join_relative(dir, target);
                if (!joined.empty()) script_candidates(joined, out);
            } else if (target.find('/') != std::string::npos) {
                std::string specifier = target;
                if (starts_with(specifier, "@/") || starts_with(specifier, "~/")) specifier = specifier.substr(2);
                script_candidates(specifier, out);
            }
            break;
        }
        case Language::C:
        case Language::Cpp: {
            std::string joined = join_relative(dir, target);
            if (!joined.empty()) out.push_back(joined);
            out.push_back(target);
            break;
        }
        case Language::Php: {
            if (ends_with(target, ".php") || ends_with(target, ".inc")) {
                std::string joined = join_relative(dir, target);
                if (!joined.empty()) out.push_back(joined);
                out.push_back(target);
            } else {
                std::string path = target;
                std::replace(path.begin(), path.end(), '\\', '/');
                while (!path.empty() && path.front() == '/') path.erase(0, 1);
                out.push_back(path + ".php");
            }
            break;
        }
        case Language::CSharp:
            out.push_back(dotted_to_path(target) + ".cs");
            break;
    }
    return out;
}

std::optional<EntityIndex> GraphBuilder::match_path(const std::string& importer, const std::string& candidate) const {
    if (candidate.empty()) return std::nullopt;

    auto slash = candidate.find_last_of('/');
    std::string name = slash == std::string::npos ? candidate : candidate.substr(slash + 1);
    auto it = basename_index_.find(name);
    if (it == basename_index_.end()) return std::nullopt;

    const std::string* best = nullptr;
    std::size_t best_depth = 0;
    for (const auto& path : it->second) {
        if (path != candidate && !ends_with(path, "/" + candidate)) continue;
        std::size_t depth = shared_directory_depth(importer, path);
        // Paths are visited in lexical order, so strict > keeps the lexically first on ties
        if (!best || depth > best_depth) {
            best = &path;
            best_depth = depth;
        }
    }
    if (!best) return std::nullopt;
    return file_index_.at(*best);
}

std::optional<EntityIndex> GraphBuilder::resolve_import(const DependencyGraph& graph, const FileInfo& file,
                                                        const std::string& target) const {
    auto candidates = import_candidates(file, target);

    for (const auto& c : candidates) {
        auto it = file_index_.find(c);
        if (it != file_index_.end()) return it->second;
    }
    for (const auto& c : candidates) {
        if (auto hit = match_path(file.path, c)) return hit;
    }

    // Last resort: the final component names a class somewhere
    std::string name = last_component(target);
    auto it = symbol_index_.find(name);
    if (it == symbol_index_.end()) return std::nullopt;

    std::optional<EntityIndex> best;
    std::size_t best_depth = 0;
    for (EntityIndex idx : it->second) {
        const Entity& e = graph.entity(idx);
        if (e.kind != EntityKind::Class || e.file_path == file.path) continue;
        std::size_t depth = shared_directory_depth(file.path, e.file_path);
        if (!best || depth > best_depth) {
            best = idx;
            best_depth = depth;
        }
    }
    return best;
}

std::optional<EntityIndex> GraphBuilder::resolve_symbol(const DependencyGraph& graph, const FileInfo& file,
                                                        EntityIndex source, const std::string& target,
                                                        RelationKind kind,
                                                        const std::set<std::string>& imported_files) const {
    auto dot = target.find_last_of('.');
    std::string name = dot == std::string::npos ? target : target.substr(dot + 1);
    auto it = symbol_index_.find(name);
    if (it == symbol_index_.end()) return std::nullopt;

    const bool qualified = dot != std::string::npos;
    std::vector<EntityIndex> candidates;
    bool any_class = false;
    for (EntityIndex idx : it->second) {
        const Entity& e = graph.entity(idx);
        if (qualified && e.qualified_name != target && !ends_with(e.qualified_name, "." + target)) continue;
        candidates.push_back(idx);
        any_class = any_class || e.kind == EntityKind::Class;
    }

    // Bases and type references name types
    if (kind != RelationKind::Call && any_class) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [&](EntityIndex idx) { return graph.entity(idx).kind != EntityKind::Class; }),
                         candidates.end());
    }
    if (candidates.empty()) return std::nullopt;

    // 1. same file, closest enclosing scope wins
    const std::string& source_scope = graph.entity(source).qualified_name;
    std::optional<EntityIndex> local;
    std::size_t local_depth = 0;
    for (EntityIndex idx : candidates) {
        const Entity& e = graph.entity(idx);
        if (e.file_path != file.path) continue;
        std::size_t depth = shared_scope_depth(source_scope, e.qualified_name);
        if (!local || depth > local_depth) {
            local = idx;
            local_depth = depth;
        }
    }
    if (local) return local;

    // 2. files this one imports
    for (EntityIndex idx : candidates) {
        if (imported_files.count(graph.entity(idx).file_path)) return idx;
    }

    // 3. unique repository-wide match
    if (config_.resolve_calls_globally && candidates.size() == 1) return candidates.front();
    return std::nullopt;
}

} // namespace code_atlas
