#include "patchmark/application/config.hpp"
#include "patchmark/string_utils.hpp"
#include <cstdlib>
#include <sstream>

namespace patchmark {

namespace {

auto parse_number(const std::string& text) -> std::optional<long long> {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// "src/app.ts:12" -> {"src/app.ts", 12}
auto parse_anchor(const std::string& text) -> std::optional<std::pair<std::string, int>> {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return std::nullopt;
    }
    auto line = parse_number(text.substr(colon + 1));
    if (!line || *line < 1) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, colon), static_cast<int>(*line));
}

} // namespace

auto config_from_environment(const EnvLookup& lookup) -> Config {
    Config config;

    if (auto max_tokens = lookup("PATCHMARK_MAX_TOKENS")) {
        // Unparseable or zero keeps the default
        if (auto value = parse_number(StringUtils::trim(*max_tokens)); value && *value > 0) {
            config.max_tokens = static_cast<size_t>(*value);
        }
    }

    if (auto show = lookup("SHOW_SKIPPED_FILES_COMMENT")) {
        config.show_skipped_notice = StringUtils::to_lowercase(StringUtils::trim(*show)) != "false";
    }

    return config;
}

auto system_environment() -> EnvLookup {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto parse_args(const std::vector<std::string>& args, Config base) -> ParseArgsResult {
    ParseArgsResult result;
    Config config = std::move(base);

    auto missing_value = [&](const std::string& option) {
        result.error = "Option " + option + " requires a value";
        return result;
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help") {
            result.show_help = true;
            return result;
        } else if (arg == "-i" || arg == "--input") {
            if (!has_value) return missing_value(arg);
            config.input_file = args[++i];
        } else if (arg == "--max-tokens") {
            if (!has_value) return missing_value(arg);
            auto value = parse_number(args[++i]);
            if (!value || *value < 0) {
                result.error = "Invalid value for --max-tokens: " + args[i];
                return result;
            }
            config.max_tokens = static_cast<size_t>(*value);
        } else if (arg == "--delay-ms") {
            if (!has_value) return missing_value(arg);
            auto value = parse_number(args[++i]);
            if (!value || *value < 0) {
                result.error = "Invalid value for --delay-ms: " + args[i];
                return result;
            }
            config.batch_delay = std::chrono::milliseconds(*value);
        } else if (arg == "--no-skipped-notice") {
            config.show_skipped_notice = false;
        } else if (arg == "--mode") {
            if (!has_value) return missing_value(arg);
            auto mode = mode_from_string(args[++i]);
            if (!mode) {
                result.error = "Unknown mode: " + args[i] + " (expected structured or suggestions)";
                return result;
            }
            config.mode = *mode;
        } else if (arg == "--estimator") {
            if (!has_value) return missing_value(arg);
            auto estimator = estimator_from_string(args[++i]);
            if (!estimator) {
                result.error = "Unknown estimator: " + args[i] + " (expected chars or lexical)";
                return result;
            }
            config.estimator = *estimator;
        } else if (arg == "--response") {
            if (!has_value) return missing_value(arg);
            config.response_file = args[++i];
        } else if (arg == "--refuse") {
            if (!has_value) return missing_value(arg);
            auto anchor = parse_anchor(args[++i]);
            if (!anchor) {
                result.error = "Invalid anchor for --refuse: " + args[i] + " (expected file:line)";
                return result;
            }
            config.refused_lines.insert(*anchor);
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else {
            result.error = "Unknown option: " + arg;
            return result;
        }
    }

    result.config = std::move(config);
    return result;
}

auto validate_config(const Config& config) -> std::optional<std::string> {
    if (config.max_tokens < 1 || config.max_tokens > max_tokens_upper_limit) {
        return "Invalid max_tokens value: " + std::to_string(config.max_tokens)
               + ". Must be between 1 and " + std::to_string(max_tokens_upper_limit);
    }
    if (unit_budget(config) == 0) {
        return "max_tokens of " + std::to_string(config.max_tokens) + " leaves no budget per file";
    }
    if (config.input_file.empty()) {
        return "No input file given";
    }
    return std::nullopt;
}

auto unit_budget(const Config& config) -> size_t {
    return config.max_tokens / 2;
}

auto mode_from_string(const std::string& name) -> std::optional<ReviewMode> {
    if (name == "structured") return ReviewMode::STRUCTURED;
    if (name == "suggestions") return ReviewMode::SUGGESTIONS;
    return std::nullopt;
}

auto mode_name(ReviewMode mode) -> std::string {
    switch (mode) {
    case ReviewMode::STRUCTURED:
        return "structured";
    case ReviewMode::SUGGESTIONS:
        return "suggestions";
    }
    return "structured";
}

auto usage_text() -> std::string {
    std::ostringstream oss;
    oss << "Usage: patchmark [options]\n";
    oss << "  -i, --input <file>         Read the unified diff from file (default: stdin)\n";
    oss << "      --max-tokens <n>       Request size; half of it is the per-batch budget (default: 4096)\n";
    oss << "      --delay-ms <n>         Minimum pause between batches (default: 20000)\n";
    oss << "      --no-skipped-notice    Do not post the notice listing over-budget files\n";
    oss << "      --mode <name>          structured | suggestions (default: structured)\n";
    oss << "      --estimator <name>     chars | lexical (default: chars)\n";
    oss << "      --response <file>      Recorded generation response replayed for every batch\n";
    oss << "      --refuse <file:line>   Treat this anchor as refused by the host (repeatable)\n";
    oss << "      --dry-run              Print batches and placement candidates only\n";
    oss << "  -h, --help                 Show this help\n";
    oss << "\nEnvironment:\n";
    oss << "  PATCHMARK_MAX_TOKENS          Default for --max-tokens\n";
    oss << "  SHOW_SKIPPED_FILES_COMMENT    Set to 'false' to hide the skipped files notice\n";
    oss << "\nExamples:\n";
    oss << "  git diff main...feature | patchmark --dry-run\n";
    oss << "  patchmark -i pr.diff --response review.json --delay-ms 0\n";
    return oss.str();
}

} // namespace patchmark
