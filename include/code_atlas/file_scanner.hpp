#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "code_atlas/config.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

struct ScanFilter {
    std::vector<std::string> include_patterns;   // empty = everything
    std::vector<std::string> exclude_patterns;

    static ScanFilter from_config(const Config& config);

    // fnmatch against the relative path and against the bare file name.
    bool excluded(const std::string& relative_path) const;
    bool included(const std::string& relative_path) const;
};

// Repository-relative ('/'-separated) paths of every source file with a
// registered language, sorted. Unreadable directories are logged and skipped.
std::vector<std::string> scan_repository(const fs::path& root, const ScanFilter& filter);

} // namespace code_atlas
