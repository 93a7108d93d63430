#include "patchmark/application/config.hpp"
#include "patchmark/application/review_app.hpp"
#include "patchmark/io/file_system.hpp"
#include "patchmark/io/offline_collaborators.hpp"
#include "patchmark/parsers/diff_parser.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace patchmark;

    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_args(args, config_from_environment(system_environment()));

    if (parsed.show_help) {
        std::cout << usage_text();
        return 0;
    }
    if (!parsed.config) {
        std::cerr << "Error: " << parsed.error << "\n\n" << usage_text();
        return 1;
    }
    const Config config = std::move(*parsed.config);

    auto filesystem = std::make_unique<FileSystem>();

    std::optional<std::string> recorded_response;
    if (!config.response_file.empty()) {
        recorded_response = filesystem->read_text(config.response_file);
        if (!recorded_response) {
            std::cerr << "Error: Could not read response from " << config.response_file << "\n";
            return 1;
        }
    }

    std::cout << "patchmark: mode " << mode_name(config.mode) << ", estimator "
              << estimator_name(config.estimator) << ", budget " << unit_budget(config)
              << " units per batch\n";
    if (config.dry_run) {
        std::cout << "DRY RUN MODE - nothing will be requested or posted\n";
    }

    ReviewApp app(std::move(filesystem), std::make_unique<UnifiedDiffParser>(),
                  std::make_unique<RecordedBackend>(std::move(recorded_response)),
                  std::make_unique<ConsolePoster>(std::cout, config.refused_lines),
                  std::make_unique<ThreadPacer>());

    return app.run(config);
}
