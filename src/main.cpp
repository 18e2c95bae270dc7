#include <spdlog/spdlog.h>
#include <exception>
#include <filesystem>
#include <string>

#include "code_atlas/artifact_writer.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/errors.hpp"
#include "code_atlas/pipeline.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* argv0) {
    spdlog::error("usage: {} <repo_root> [config.json] [output_dir]", argv0);
}

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2 || argc > 4) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    const fs::path repo_root = fs::absolute(argv[1]).lexically_normal();
    if (!fs::is_directory(repo_root)) {
        spdlog::error("not a directory: {}", repo_root.string());
        print_usage(argv[0]);
        return kExitUsage;
    }

    try {
        code_atlas::Config config = argc >= 3 ? code_atlas::load_config(argv[2]) : code_atlas::Config{};
        if (config.repository_name.empty()) {
            std::string dir_name = repo_root.filename().string();
            config.repository_name = dir_name.empty() ? "repository" : dir_name;
        }
        config.validate();
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        const fs::path output_dir = argc >= 4 ? fs::path(argv[3]) : fs::path("code_atlas_output");
        spdlog::info("Analyzing {} (module budget {}, leaf budget {}, max depth {})", repo_root.string(),
                     config.max_token_per_module, config.max_token_per_leaf_module, config.max_depth);

        code_atlas::Pipeline pipeline(config);
        code_atlas::PipelineResult result = pipeline.run(repo_root);

        code_atlas::ArtifactWriter writer(output_dir);
        writer.write(result, repo_root);

        spdlog::info("\n{}", result.tree->render_text());
        return kExitOk;
    } catch (const code_atlas::ConfigurationError& e) {
        spdlog::critical("{}", e.what());
    } catch (const code_atlas::InvariantViolation& e) {
        spdlog::critical("{} [{}]", e.what(), e.invariant());
    } catch (const std::exception& e) {
        spdlog::critical("fatal: {}", e.what());
    }
    return kExitFatal;
}
