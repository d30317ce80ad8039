#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/warden_errors.hpp"

namespace {

using warden::app::cli::parse_and_validate;
using warden::core::errors::ErrorCategory;
using warden::core::errors::get_error;
using warden::core::errors::get_value;
using warden::core::errors::is_error;
using warden::protocol::CliCommand;
using warden::protocol::CliRequest;

warden::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("warden_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenCommandTextMissing) {
    auto result = parse_tokens({"check-command"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"check-file", "--path"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"check-command", "--command", "ls", "--force"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, RejectsFlagsOfAnotherCommand) {
    auto result = parse_tokens({"check-file", "--path", "a.txt", "--command", "ls"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsWhenToolNameMissing) {
    auto result = parse_tokens({"check-tool", "--input", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, ParsesCheckCommand) {
    auto result = parse_tokens({"check-command", "--command", "rm -rf /", "--verbose",
                                "--stats", "--config", "warden.json"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::CheckCommand);
    ASSERT_TRUE(req.command_text.has_value());
    EXPECT_EQ(req.command_text.value(), "rm -rf /");
    EXPECT_TRUE(req.verbose);
    EXPECT_TRUE(req.print_stats);
    ASSERT_TRUE(req.config_file.has_value());
    EXPECT_EQ(req.config_file->string(), "warden.json");
}

TEST(CliParserTest, KeepsEmptyCommandTextForTheValidator) {
    auto result = parse_tokens({"check-command", "--command", ""});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).command_text.value(), "");
}

TEST(CliParserTest, ParsesCheckToolWithDefaultInput) {
    auto result = parse_tokens({"check-tool", "--tool", "Bash"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::CheckTool);
    EXPECT_EQ(req.tool_name.value(), "Bash");
    EXPECT_EQ(req.tool_input, "{}");
    EXPECT_FALSE(req.verbose);
}

TEST(CliParserTest, ParsesBatchAndListPatterns) {
    auto batch = parse_tokens({"batch", "--config", "c.json"});
    ASSERT_FALSE(is_error(batch));
    EXPECT_EQ(get_value(batch).command, CliCommand::Batch);

    auto listing = parse_tokens({"list-patterns"});
    ASSERT_FALSE(is_error(listing));
    EXPECT_EQ(get_value(listing).command, CliCommand::ListPatterns);
    EXPECT_FALSE(get_value(listing).config_file.has_value());
}

}  // namespace
