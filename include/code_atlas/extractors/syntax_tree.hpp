#pragma once
#include <tree_sitter/api.h>
#include <cstdint>
#include <string>
#include <string_view>

// Grammars are linked from the tree-sitter language libraries
extern "C" {
    const TSLanguage* tree_sitter_python();
    const TSLanguage* tree_sitter_java();
    const TSLanguage* tree_sitter_javascript();
    const TSLanguage* tree_sitter_typescript();
    const TSLanguage* tree_sitter_tsx();
    const TSLanguage* tree_sitter_c();
    const TSLanguage* tree_sitter_cpp();
    const TSLanguage* tree_sitter_c_sharp();
    const TSLanguage* tree_sitter_php();
}

namespace code_atlas::extract {

// Owns one parser and the tree it produced. Not shareable across threads.
class SyntaxTree {
public:
    SyntaxTree(const TSLanguage* grammar, std::string_view source);
    ~SyntaxTree();

    SyntaxTree(const SyntaxTree&) = delete;
    SyntaxTree& operator=(const SyntaxTree&) = delete;

    bool valid() const { return tree_ != nullptr; }
    bool has_error() const;

    TSNode root() const;
    std::string_view source() const { return source_; }

    std::string_view text(TSNode node) const;
    static std::string_view type(TSNode node) { return ts_node_is_null(node) ? "" : ts_node_type(node); }
    static TSNode field(TSNode node, std::string_view name);
    static bool is_null(TSNode node) { return ts_node_is_null(node); }

    // 1-based line numbers
    static std::uint32_t start_line(TSNode node) { return ts_node_start_point(node).row + 1; }
    static std::uint32_t end_line(TSNode node) { return ts_node_end_point(node).row + 1; }

private:
    TSParser* parser_ = nullptr;
    TSTree* tree_ = nullptr;
    std::string_view source_;
};

// Strips one layer of matching quotes, <> brackets or backticks.
std::string unquote(std::string_view text);

} // namespace code_atlas::extract
