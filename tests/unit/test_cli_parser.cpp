#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/popper_errors.hpp"

namespace {

using popper::app::cli::parse_command_line;
using popper::app::cli::parse_run_arguments;
using popper::app::cli::RawRunOptions;
using popper::app::cli::split_arguments;
using popper::core::errors::ErrorCategory;
using popper::core::errors::get_error;
using popper::core::errors::get_value;
using popper::core::errors::is_error;
using popper::protocol::Runtime;

popper::core::errors::Result<RawRunOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("popper");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_command_line(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, BareRunHasNothingSet) {
    auto result = parse_tokens({"run"});
    ASSERT_FALSE(is_error(result));

    const auto& raw = get_value(result);
    EXPECT_FALSE(raw.action.has_value());
    EXPECT_FALSE(raw.wfile.has_value());
    EXPECT_FALSE(raw.runtime.has_value());
    EXPECT_TRUE(raw.skip.empty());
    EXPECT_FALSE(raw.debug);
    EXPECT_FALSE(raw.help);
}

TEST(CliParserTest, ParsesEveryOption) {
    auto result = parse_tokens({"run", "build", "--wfile", "ci/a.workflow", "--debug", "--quiet",
                                "--dry-run", "--log-file", "out.log", "--on-failure", "notify",
                                "--parallel", "--reuse", "--runtime", "singularity",
                                "--skip-clone", "--skip-pull", "--with-dependencies",
                                "--workspace", "/src"});
    ASSERT_FALSE(is_error(result));

    const auto& raw = get_value(result);
    EXPECT_EQ(raw.action.value(), "build");
    EXPECT_EQ(raw.wfile.value(), "ci/a.workflow");
    EXPECT_EQ(raw.log_file.value(), "out.log");
    EXPECT_EQ(raw.on_failure.value(), "notify");
    EXPECT_EQ(raw.workspace.value(), "/src");
    EXPECT_EQ(raw.runtime.value(), Runtime::Singularity);
    EXPECT_TRUE(raw.debug);
    EXPECT_TRUE(raw.quiet);
    EXPECT_TRUE(raw.dry_run);
    EXPECT_TRUE(raw.parallel);
    EXPECT_TRUE(raw.reuse);
    EXPECT_TRUE(raw.skip_clone);
    EXPECT_TRUE(raw.skip_pull);
    EXPECT_TRUE(raw.with_dependencies);
}

TEST(CliParserTest, SkipIsRepeatable) {
    auto result = parse_run_arguments({"--skip", "lint", "--skip=docs"});
    ASSERT_FALSE(is_error(result));
    const auto& raw = get_value(result);
    ASSERT_EQ(raw.skip.size(), 2u);
    EXPECT_EQ(raw.skip[0], "lint");
    EXPECT_EQ(raw.skip[1], "docs");
}

TEST(CliParserTest, AcceptsInlineValues) {
    auto result = parse_run_arguments({"--wfile=x.workflow", "--runtime=docker"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).wfile.value(), "x.workflow");
    EXPECT_EQ(get_value(result).runtime.value(), Runtime::Docker);
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_run_arguments({"--wfile"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenValueEmpty) {
    auto result = parse_run_arguments({"--on-failure="});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownRuntime) {
    auto result = parse_run_arguments({"--runtime", "podman"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_choice");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsOnUnknownOption) {
    auto result = parse_run_arguments({"--recursive"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsOnSecondPositional) {
    auto result = parse_run_arguments({"build", "test"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_argument");
}

TEST(CliParserTest, FailsWhenFlagGivenAValue) {
    auto result = parse_run_arguments({"--debug=yes"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_value");
}

TEST(CliParserTest, HelpIsRecognised) {
    auto result = parse_tokens({"run", "-h"});
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).help);
}

TEST(CliParserTest, DirectivePayloadParsesLikeCommandLine) {
    const auto tokens = split_arguments("--wfile a.workflow   build\t");
    ASSERT_EQ(tokens.size(), 3u);

    auto from_directive = parse_run_arguments(tokens);
    auto from_command_line = parse_tokens({"run", "--wfile", "a.workflow", "build"});
    ASSERT_FALSE(is_error(from_directive));
    ASSERT_FALSE(is_error(from_command_line));
    EXPECT_EQ(get_value(from_directive).wfile, get_value(from_command_line).wfile);
    EXPECT_EQ(get_value(from_directive).action, get_value(from_command_line).action);
}

TEST(CliParserTest, SplitOfBlankPayloadIsEmpty) {
    EXPECT_TRUE(split_arguments("   ").empty());
}

}  // namespace
