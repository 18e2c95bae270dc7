#include "code_atlas/extractors/syntax_tree.hpp"

namespace code_atlas::extract {

SyntaxTree::SyntaxTree(const TSLanguage* grammar, std::string_view source)
    : source_(source) {
    parser_ = ts_parser_new();
    if (!parser_ || !grammar || !ts_parser_set_language(parser_, grammar)) return;

    tree_ = ts_parser_parse_string(parser_, nullptr, source_.data(),
                                   static_cast<std::uint32_t>(source_.size()));
}

SyntaxTree::~SyntaxTree() {
    if (tree_) ts_tree_delete(tree_);
    if (parser_) ts_parser_delete(parser_);
}

bool SyntaxTree::has_error() const {
    return tree_ && ts_node_has_error(ts_tree_root_node(tree_));
}

TSNode SyntaxTree::root() const {
    return ts_tree_root_node(tree_);
}

std::string_view SyntaxTree::text(TSNode node) const {
    if (ts_node_is_null(node)) return {};
    std::uint32_t start = ts_node_start_byte(node);
    std::uint32_t end = ts_node_end_byte(node);
    if (start >= source_.size() || end <= start) return {};
    if (end > source_.size()) end = static_cast<std::uint32_t>(source_.size());
    return source_.substr(start, end - start);
}

TSNode SyntaxTree::field(TSNode node, std::string_view name) {
    return ts_node_child_by_field_name(node, name.data(), static_cast<std::uint32_t>(name.size()));
}

std::string unquote(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);
    if (text.size() >= 2) {
        char f = text.front();
        char b = text.back();
        if ((f == '"' && b == '"') || (f == '\'' && b == '\'') || (f == '`' && b == '`') ||
            (f == '<' && b == '>')) {
            return std::string(text.substr(1, text.size() - 2));
        }
    }
    return std::string(text);
}

} // namespace code_atlas::extract
