#include "code_atlas/module_tree.hpp"
#include <algorithm>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace code_atlas {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

template <typename T>
T required(const json& j, const char* key) {
    if (!j.contains(key)) throw std::invalid_argument(std::string("module is missing '") + key + "'");
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("module field '") + key + "' has the wrong type: " + e.what());
    }
}

void walk(const Module& m, const std::function<void(const Module&)>& visit) {
    std::vector<const Module*> stack{&m};
    while (!stack.empty()) {
        const Module* cur = stack.back();
        stack.pop_back();
        visit(*cur);
        for (auto it = cur->children.rbegin(); it != cur->children.rend(); ++it) stack.push_back(&*it);
    }
}

} // namespace

ordered_json Module::to_json() const {
    ordered_json j;
    j["module_id"] = module_id;
    j["name"] = name;
    j["leaf"] = leaf;
    j["token_count"] = token_count;
    j["depth"] = depth;
    j["entity_ids"] = entity_ids;
    j["children"] = ordered_json::array();
    for (const auto& child : children) j["children"].push_back(child.to_json());
    j["path"] = path;
    j["oversized"] = oversized;
    j["complex"] = complex;
    return j;
}

Module Module::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("module must be a JSON object");

    Module m;
    m.module_id = required<std::string>(j, "module_id");
    m.name = j.value("name", m.module_id);
    m.leaf = required<bool>(j, "leaf");
    m.depth = j.value("depth", 0);
    m.token_count = j.value("token_count", std::size_t{0});
    m.path = j.value("path", "");
    m.oversized = j.value("oversized", false);
    m.complex = j.value("complex", false);
    if (j.contains("entity_ids")) m.entity_ids = required<std::vector<std::string>>(j, "entity_ids");
    if (j.contains("children")) {
        const auto& children = j.at("children");
        if (!children.is_array()) throw std::invalid_argument("module field 'children' must be an array");
        for (const auto& c : children) m.children.push_back(Module::from_json(c));
    }
    return m;
}

ModuleTree::ModuleTree(Module root)
    : root_(std::make_shared<const Module>(std::move(root))) {
    auto index = std::make_shared<std::unordered_map<std::string, const Module*>>();
    walk(*root_, [&](const Module& m) {
        if (!m.leaf) return;
        for (const auto& id : m.entity_ids) index->emplace(id, &m);
    });
    leaf_index_ = std::move(index);
}

std::vector<std::string> ModuleTree::processing_order() const {
    std::vector<std::string> order;
    struct Frame {
        const Module* module;
        std::size_t next;
    };
    std::vector<Frame> stack{{root_.get(), 0}};
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next < top.module->children.size()) {
            const Module* child = &top.module->children[top.next++];
            stack.push_back({child, 0});
            continue;
        }
        order.push_back(top.module->module_id);
        stack.pop_back();
    }
    return order;
}

std::vector<const Module*> ModuleTree::leaves() const {
    std::vector<const Module*> out;
    walk(*root_, [&](const Module& m) {
        if (m.leaf) out.push_back(&m);
    });
    return out;
}

const Module* ModuleTree::leaf_of(std::string_view entity_id) const {
    auto it = leaf_index_->find(std::string(entity_id));
    return it == leaf_index_->end() ? nullptr : it->second;
}

const Module* ModuleTree::find(std::string_view module_id) const {
    const Module* found = nullptr;
    walk(*root_, [&](const Module& m) {
        if (!found && m.module_id == module_id) found = &m;
    });
    return found;
}

std::size_t ModuleTree::module_count() const {
    std::size_t n = 0;
    walk(*root_, [&](const Module&) { ++n; });
    return n;
}

int ModuleTree::max_depth() const {
    int depth = 0;
    walk(*root_, [&](const Module& m) { depth = std::max(depth, m.depth); });
    return depth;
}

std::string ModuleTree::render_text() const {
    std::ostringstream out;
    auto label = [](const Module& m) {
        std::string s = m.name + " [" + m.module_id + "] " + std::to_string(m.token_count) + " tokens";
        if (m.leaf) s += ", " + std::to_string(m.entity_ids.size()) + " entities";
        if (m.oversized) s += " (oversized)";
        return s;
    };

    out << label(*root_) << "\n";

    std::function<void(const Module&, const std::string&)> draw;
    draw = [&](const Module& node, const std::string& prefix) {
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            bool is_last = i + 1 == node.children.size();
            const Module& child = node.children[i];
            out << prefix << (is_last ? "└── " : "├── ") << label(child) << "\n";
            draw(child, prefix + (is_last ? "    " : "│   "));
        }
    };
    draw(*root_, "");
    return out.str();
}

std::string ModuleTree::dump() const {
    return to_json().dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

} // namespace code_atlas
