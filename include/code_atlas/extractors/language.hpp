#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_atlas {

enum class Language {
    Python,
    Java,
    JavaScript,
    TypeScript,
    C,
    Cpp,
    CSharp,
    Php,
};

std::string_view to_string(Language language);
std::optional<Language> language_from_name(std::string_view name);

// Resolved from the lowercase file extension through the static registry.
std::optional<Language> language_from_path(std::string_view path);

// Every extension (with leading dot) the registry knows about.
const std::vector<std::string>& supported_extensions();

} // namespace code_atlas
