#include "patchmark/application/config.hpp"
#include <gtest/gtest.h>
#include <map>

namespace patchmark {

class ConfigTest : public ::testing::Test {
protected:
    auto lookup() -> EnvLookup {
        return [this](const std::string& name) -> std::optional<std::string> {
            auto it = environment_.find(name);
            if (it == environment_.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }

    std::map<std::string, std::string> environment_;
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment)
{
    auto config = config_from_environment(lookup());

    EXPECT_EQ(config.input_file, "-");
    EXPECT_EQ(config.max_tokens, 4096);
    EXPECT_EQ(unit_budget(config), 2048);
    EXPECT_EQ(config.batch_delay, std::chrono::milliseconds(20000));
    EXPECT_TRUE(config.show_skipped_notice);
    EXPECT_EQ(config.mode, ReviewMode::STRUCTURED);
    EXPECT_EQ(config.estimator, EstimatorKind::CHARS);
    EXPECT_FALSE(config.dry_run);
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults)
{
    environment_["PATCHMARK_MAX_TOKENS"] = "1000";
    environment_["SHOW_SKIPPED_FILES_COMMENT"] = "FALSE";

    auto config = config_from_environment(lookup());

    EXPECT_EQ(config.max_tokens, 1000);
    EXPECT_EQ(unit_budget(config), 500);
    EXPECT_FALSE(config.show_skipped_notice);
}

TEST_F(ConfigTest, OnlyFalseHidesSkippedNotice)
{
    environment_["SHOW_SKIPPED_FILES_COMMENT"] = "no";

    EXPECT_TRUE(config_from_environment(lookup()).show_skipped_notice);
}

TEST_F(ConfigTest, UnparseableEnvironmentKeepsDefault)
{
    environment_["PATCHMARK_MAX_TOKENS"] = "lots";

    EXPECT_EQ(config_from_environment(lookup()).max_tokens, default_max_tokens);
}

TEST_F(ConfigTest, ParsesAllOptions)
{
    auto result = parse_args({"-i", "pr.diff", "--max-tokens", "800", "--delay-ms", "0",
                              "--no-skipped-notice", "--mode", "suggestions", "--estimator",
                              "lexical", "--response", "review.txt", "--refuse", "src/a.cpp:12",
                              "--dry-run"},
                             Config{});

    ASSERT_TRUE(result.config.has_value());
    const auto& config = *result.config;
    EXPECT_EQ(config.input_file, "pr.diff");
    EXPECT_EQ(config.max_tokens, 800);
    EXPECT_EQ(config.batch_delay.count(), 0);
    EXPECT_FALSE(config.show_skipped_notice);
    EXPECT_EQ(config.mode, ReviewMode::SUGGESTIONS);
    EXPECT_EQ(config.estimator, EstimatorKind::LEXICAL);
    EXPECT_EQ(config.response_file, "review.txt");
    EXPECT_TRUE(config.refused_lines.contains({"src/a.cpp", 12}));
    EXPECT_TRUE(config.dry_run);
}

TEST_F(ConfigTest, ArgumentsOverrideEnvironment)
{
    environment_["PATCHMARK_MAX_TOKENS"] = "1000";

    auto result = parse_args({"--max-tokens", "64"}, config_from_environment(lookup()));

    ASSERT_TRUE(result.config.has_value());
    EXPECT_EQ(result.config->max_tokens, 64);
}

TEST_F(ConfigTest, ReportsBadArguments)
{
    EXPECT_FALSE(parse_args({"--max-tokens"}, Config{}).config.has_value());
    EXPECT_EQ(parse_args({"--max-tokens", "abc"}, Config{}).error, "Invalid value for --max-tokens: abc");
    EXPECT_EQ(parse_args({"--bogus"}, Config{}).error, "Unknown option: --bogus");
    EXPECT_FALSE(parse_args({"--mode", "poetry"}, Config{}).config.has_value());
    EXPECT_FALSE(parse_args({"--refuse", "src/a.cpp"}, Config{}).config.has_value());
    EXPECT_FALSE(parse_args({"--refuse", "src/a.cpp:0"}, Config{}).config.has_value());
}

TEST_F(ConfigTest, HelpShortCircuits)
{
    auto result = parse_args({"--help", "--bogus"}, Config{});

    EXPECT_TRUE(result.show_help);
    EXPECT_TRUE(result.error.empty());
    EXPECT_NE(usage_text().find("--max-tokens"), std::string::npos);
}

TEST_F(ConfigTest, ValidatesMaxTokensRange)
{
    Config config;

    config.max_tokens = 0;
    EXPECT_TRUE(validate_config(config).has_value());

    config.max_tokens = 1;
    EXPECT_TRUE(validate_config(config).has_value()) << "half of 1 leaves no budget";

    config.max_tokens = 2;
    EXPECT_FALSE(validate_config(config).has_value());

    config.max_tokens = max_tokens_upper_limit;
    EXPECT_FALSE(validate_config(config).has_value());

    config.max_tokens = max_tokens_upper_limit + 1;
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, EmptyInputPathIsInvalid)
{
    Config config;
    config.input_file = "";

    EXPECT_EQ(validate_config(config), "No input file given");
}

TEST_F(ConfigTest, ModeNames)
{
    EXPECT_EQ(mode_from_string("structured"), ReviewMode::STRUCTURED);
    EXPECT_EQ(mode_name(ReviewMode::SUGGESTIONS), "suggestions");
}

} // namespace patchmark
