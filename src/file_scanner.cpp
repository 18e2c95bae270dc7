#include "code_atlas/file_scanner.hpp"
#include "code_atlas/extractors/language.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

bool matches(const std::string& pattern, const std::string& relative_path) {
    if (fnmatch(pattern.c_str(), relative_path.c_str(), 0) == 0) return true;
    auto slash = relative_path.find_last_of('/');
    std::string name = slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
    return fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

void scan_directory(const fs::path& current_dir, const fs::path& root_dir, const ScanFilter& filter,
                    std::vector<std::string>& results) {
    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", current_dir.string(), ec.message());
        return;
    }

    for (const auto& entry : it) {
        const auto& path = entry.path();
        std::string rel = fs::relative(path, root_dir).generic_string();
        if (filter.excluded(rel)) {
            spdlog::trace("SKIP | {}", rel);
            continue;
        }

        std::error_code type_ec;
        if (entry.is_symlink(type_ec)) continue;
        if (entry.is_directory(type_ec)) {
            scan_directory(path, root_dir, filter, results);
        } else if (entry.is_regular_file(type_ec)) {
            if (!language_from_path(rel) || !filter.included(rel)) continue;
            spdlog::trace("FILE | {}", rel);
            results.push_back(std::move(rel));
        }
    }
}

} // namespace

ScanFilter ScanFilter::from_config(const Config& config) {
    return ScanFilter{config.include_patterns, config.exclude_patterns};
}

bool ScanFilter::excluded(const std::string& relative_path) const {
    return std::any_of(exclude_patterns.begin(), exclude_patterns.end(),
                       [&](const std::string& p) { return matches(p, relative_path); });
}

bool ScanFilter::included(const std::string& relative_path) const {
    if (include_patterns.empty()) return true;
    return std::any_of(include_patterns.begin(), include_patterns.end(),
                       [&](const std::string& p) { return matches(p, relative_path); });
}

std::vector<std::string> scan_repository(const fs::path& root, const ScanFilter& filter) {
    std::vector<std::string> files;
    if (!fs::is_directory(root)) {
        spdlog::error("Repository root {} is not a directory", root.string());
        return files;
    }
    scan_directory(root, root, filter, files);
    std::sort(files.begin(), files.end());
    spdlog::info("Scanned {}: {} source files (include {}, exclude {})", root.string(), files.size(),
                 filter.include_patterns.size(), filter.exclude_patterns.size());
    return files;
}

} // namespace code_atlas
