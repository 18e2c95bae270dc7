#include "code_atlas/extractors/extractor.hpp"

namespace code_atlas::extract {

Extractor extractor_for(Language language) {
    switch (language) {
        case Language::Python: return PythonExtractor{};
        case Language::Java: return JavaExtractor{};
        case Language::JavaScript: return JavaScriptExtractor{};
        case Language::TypeScript: return TypeScriptExtractor{};
        case Language::C: return CExtractor{};
        case Language::Cpp: return CppExtractor{};
        case Language::CSharp: return CSharpExtractor{};
        case Language::Php: return PhpExtractor{};
    }
    return PythonExtractor{};
}

} // namespace code_atlas::extract
