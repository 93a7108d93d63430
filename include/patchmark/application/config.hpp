#pragma once

#include "patchmark/core/token_estimator.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace patchmark {

enum class ReviewMode {
    STRUCTURED,  // JSON review with per-file line comments
    SUGGESTIONS  // Free text, one "@@path@@" block per file
};

constexpr size_t default_max_tokens = 4096;
constexpr size_t max_tokens_upper_limit = 128000;

// Built once per run and passed by const reference
struct Config {
    std::string input_file = "-";  // stdin by default
    size_t max_tokens = default_max_tokens;
    std::chrono::milliseconds batch_delay{20000};
    bool show_skipped_notice = true;
    ReviewMode mode = ReviewMode::STRUCTURED;
    EstimatorKind estimator = EstimatorKind::CHARS;
    std::string response_file;  // Recorded generation response, empty for none
    std::set<std::pair<std::string, int>> refused_lines;  // file:line anchors the poster refuses
    bool dry_run = false;  // Print the plan only
};

struct ParseArgsResult {
    std::optional<Config> config;
    std::string error;
    bool show_help = false;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Defaults overlaid with PATCHMARK_MAX_TOKENS and SHOW_SKIPPED_FILES_COMMENT
auto config_from_environment(const EnvLookup& lookup) -> Config;
auto system_environment() -> EnvLookup;

// Command-line arguments (without the program name) applied on top of base
auto parse_args(const std::vector<std::string>& args, Config base) -> ParseArgsResult;

// Error message for a configuration the run must not start with
auto validate_config(const Config& config) -> std::optional<std::string>;

// Per-file and per-batch ceiling, half of max_tokens
auto unit_budget(const Config& config) -> size_t;

auto mode_from_string(const std::string& name) -> std::optional<ReviewMode>;
auto mode_name(ReviewMode mode) -> std::string;

auto usage_text() -> std::string;

} // namespace patchmark
