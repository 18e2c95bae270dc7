#include "code_atlas/code_parser.hpp"
#include "code_atlas/extractors/extractor.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <variant>
#include <omp.h>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

ParseResult failed(const std::string& path, std::string reason) {
    ParseResult r;
    r.failure = {path, std::move(reason)};
    return r;
}

} // namespace

std::size_t ExtractionReport::entity_count() const {
    std::size_t n = 0;
    for (const auto& f : files) n += f.entities.size();
    return n;
}

std::size_t ExtractionReport::relation_count() const {
    std::size_t n = 0;
    for (const auto& f : files) n += f.relations.size();
    return n;
}

ParseResult CodeParser::extract_source(const std::string& path, std::string_view content) const {
    auto language = language_from_path(path);
    if (!language) return failed(path, "unsupported language");

    try {
        extract::Extractor extractor = extract::extractor_for(*language);
        return std::visit([&](const auto& ex) -> ParseResult {
            extract::SyntaxTree tree(ex.grammar(path), content);
            if (!tree.valid()) return failed(path, "tree-sitter produced no syntax tree");
            if (tree.has_error()) {
                if (strict_syntax_) return failed(path, "syntax errors in source");
                spdlog::debug("{} has syntax errors, extracting what parsed", path);
            }

            FileExtraction fx;
            fx.path = path;
            fx.language = *language;
            fx.entities = ex.extract_entities(tree, path);
            fx.relations = ex.extract_relations(tree, fx.entities);

            ParseResult r;
            r.extraction = std::move(fx);
            return r;
        }, extractor);
    } catch (const std::exception& e) {
        return failed(path, std::string("extraction error: ") + e.what());
    }
}

ParseResult CodeParser::extract_file(const fs::path& absolute_path, const std::string& relative_path) const {
    std::ifstream f(absolute_path, std::ios::binary);
    if (!f.is_open()) return failed(relative_path, "cannot read file");

    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) return failed(relative_path, "read error");

    std::string content = buffer.str();
    return extract_source(relative_path, content);
}

ExtractionReport CodeParser::extract_files(const fs::path& root, const std::vector<std::string>& relative_paths,
                                           int worker_threads) const {
    std::vector<ParseResult> results(relative_paths.size());
    const long count = static_cast<long>(relative_paths.size());
    const int threads = worker_threads > 0 ? worker_threads : omp_get_max_threads();

    // One slot per file, no shared mutable state
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long i = 0; i < count; ++i) {
        const std::string& rel = relative_paths[static_cast<std::size_t>(i)];
        results[static_cast<std::size_t>(i)] = extract_file(root / rel, rel);
    }

    ExtractionReport report;
    report.files.reserve(results.size());
    for (auto& r : results) {
        if (r.ok()) {
            report.files.push_back(std::move(*r.extraction));
        } else {
            spdlog::warn("Skipping {}: {}", r.failure.path, r.failure.reason);
            report.failures.push_back(std::move(r.failure));
        }
    }
    return report;
}

} // namespace code_atlas
