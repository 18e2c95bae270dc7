#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "code_atlas/entity.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// Outcome of one file: exactly one of extraction / failure is meaningful.
struct ParseResult {
    std::optional<FileExtraction> extraction;
    ParseFailure failure;

    bool ok() const { return extraction.has_value(); }
};

struct ExtractionReport {
    std::vector<FileExtraction> files;    // successful files, input order
    std::vector<ParseFailure> failures;

    std::size_t entity_count() const;
    std::size_t relation_count() const;
};

// Drives the per-language extractors over whole files. Stateless, so one
// instance can be shared by every worker; each call builds its own parser.
class CodeParser {
public:
    explicit CodeParser(bool strict_syntax = false) : strict_syntax_(strict_syntax) {}

    // `path` is repository-relative and selects the language.
    ParseResult extract_source(const std::string& path, std::string_view content) const;

    ParseResult extract_file(const fs::path& absolute_path, const std::string& relative_path) const;

    // Parallel over files (OpenMP). Results keep the order of `relative_paths`.
    ExtractionReport extract_files(const fs::path& root, const std::vector<std::string>& relative_paths,
                                   int worker_threads = 0) const;

private:
    bool strict_syntax_;
};

} // namespace code_atlas
