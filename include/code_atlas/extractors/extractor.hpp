#pragma once
#include <string_view>
#include <variant>
#include "code_atlas/extractors/language.hpp"
#include "code_atlas/extractors/tree_walker.hpp"

namespace code_atlas::extract {

struct PythonExtractor : TreeSitterExtractor<PythonExtractor> {
    static constexpr Language kLanguage = Language::Python;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    bool is_heritage(TSNode node, const SyntaxTree& tree) const;
    void collect_bases(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct JavaExtractor : TreeSitterExtractor<JavaExtractor> {
    static constexpr Language kLanguage = Language::Java;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct JavaScriptExtractor : TreeSitterExtractor<JavaScriptExtractor> {
    static constexpr Language kLanguage = Language::JavaScript;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    bool is_entity(TSNode node, const SyntaxTree& tree) const;
    std::vector<std::string> parameters(TSNode node, const SyntaxTree& tree) const;
    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct TypeScriptExtractor : TreeSitterExtractor<TypeScriptExtractor> {
    static constexpr Language kLanguage = Language::TypeScript;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const; // .tsx selects the TSX grammar

    bool is_entity(TSNode node, const SyntaxTree& tree) const;
    std::vector<std::string> parameters(TSNode node, const SyntaxTree& tree) const;
    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct CExtractor : TreeSitterExtractor<CExtractor> {
    static constexpr Language kLanguage = Language::C;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    bool is_entity(TSNode node, const SyntaxTree& tree) const;
    std::string entity_name(TSNode node, const SyntaxTree& tree) const;
    std::vector<std::string> parameters(TSNode node, const SyntaxTree& tree) const;
    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct CppExtractor : TreeSitterExtractor<CppExtractor> {
    static constexpr Language kLanguage = Language::Cpp;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    bool is_entity(TSNode node, const SyntaxTree& tree) const;
    std::string entity_name(TSNode node, const SyntaxTree& tree) const;
    std::vector<std::string> parameters(TSNode node, const SyntaxTree& tree) const;
    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct CSharpExtractor : TreeSitterExtractor<CSharpExtractor> {
    static constexpr Language kLanguage = Language::CSharp;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

struct PhpExtractor : TreeSitterExtractor<PhpExtractor> {
    static constexpr Language kLanguage = Language::Php;
    static const NodeRules& rules();
    const TSLanguage* grammar(std::string_view path) const;

    void collect_calls(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
    void collect_imports(TSNode node, const SyntaxTree& tree, RelationSink& out) const;
};

// Closed set of language variants; dispatch with std::visit.
using Extractor = std::variant<PythonExtractor, JavaExtractor, JavaScriptExtractor, TypeScriptExtractor,
                               CExtractor, CppExtractor, CSharpExtractor, PhpExtractor>;

Extractor extractor_for(Language language);

// Helpers shared by the C-family variants.
TSNode innermost_declarator(TSNode declarator);
std::string declarator_name(TSNode function_definition, const SyntaxTree& tree);

} // namespace code_atlas::extract
