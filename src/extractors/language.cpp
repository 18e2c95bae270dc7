#include "code_atlas/extractors/language.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>

namespace code_atlas {

namespace {

struct ExtensionEntry {
    std::string_view extension;
    Language language;
};

constexpr std::array<ExtensionEntry, 20> kExtensionRegistry = {{
    {".py", Language::Python},
    {".java", Language::Java},
    {".js", Language::JavaScript},
    {".jsx", Language::JavaScript},
    {".mjs", Language::JavaScript},
    {".cjs", Language::JavaScript},
    {".ts", Language::TypeScript},
    {".tsx", Language::TypeScript},
    {".c", Language::C},
    {".h", Language::C},
    {".cc", Language::Cpp},
    {".cpp", Language::Cpp},
    {".cxx", Language::Cpp},
    {".c++", Language::Cpp},
    {".hpp", Language::Cpp},
    {".hh", Language::Cpp},
    {".hxx", Language::Cpp},
    {".h++", Language::Cpp},
    {".cs", Language::CSharp},
    {".php", Language::Php},
}};

struct NameEntry {
    std::string_view name;
    Language language;
};

constexpr std::array<NameEntry, 8> kNames = {{
    {"python", Language::Python},
    {"java", Language::Java},
    {"javascript", Language::JavaScript},
    {"typescript", Language::TypeScript},
    {"c", Language::C},
    {"cpp", Language::Cpp},
    {"csharp", Language::CSharp},
    {"php", Language::Php},
}};

} // namespace

std::string_view to_string(Language language) {
    for (const auto& entry : kNames) {
        if (entry.language == language) return entry.name;
    }
    return "unknown";
}

std::optional<Language> language_from_name(std::string_view name) {
    for (const auto& entry : kNames) {
        if (entry.name == name) return entry.language;
    }
    return std::nullopt;
}

std::optional<Language> language_from_path(std::string_view path) {
    std::string ext = std::filesystem::path(std::string(path)).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext.empty()) return std::nullopt;

    for (const auto& entry : kExtensionRegistry) {
        if (entry.extension == ext) return entry.language;
    }
    return std::nullopt;
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> extensions = [] {
        std::vector<std::string> out;
        for (const auto& entry : kExtensionRegistry) out.emplace_back(entry.extension);
        return out;
    }();
    return extensions;
}

} // namespace code_atlas
