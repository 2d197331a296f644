#include <chrono>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/askai_errors.hpp"

namespace {

using askai::app::cli::parse_and_validate;
using askai::core::errors::ErrorCategory;
using askai::core::errors::get_error;
using askai::core::errors::get_value;
using askai::core::errors::is_error;
using askai::protocol::CliCommand;
using askai::protocol::CliRequest;

askai::core::errors::Result<CliRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("askai");
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
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, RunRequiresOperation) {
    auto result = parse_tokens({"run", "--text", "hello"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, CallRequiresPrompt) {
    auto result = parse_tokens({"call", "--provider", "claude"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"run", "--operation"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"operations", "--fast"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, RejectsFlagsOfOtherCommands) {
    auto prompt_on_run = parse_tokens({"run", "--operation", "improve", "--prompt", "x"});
    ASSERT_TRUE(is_error(prompt_on_run));
    EXPECT_EQ(get_error(prompt_on_run).code, "conflicting_flags");

    auto text_on_call = parse_tokens({"call", "--prompt", "x", "--text", "y"});
    ASSERT_TRUE(is_error(text_on_call));
    EXPECT_EQ(get_error(text_on_call).code, "conflicting_flags");

    auto provider_on_check = parse_tokens({"check", "--provider", "gemini"});
    ASSERT_TRUE(is_error(provider_on_check));
    EXPECT_EQ(get_error(provider_on_check).code, "conflicting_flags");
}

TEST(CliParserTest, FailsOnMalformedParam) {
    auto result = parse_tokens({"run", "--operation", "translate", "--param", "French"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_param");

    auto no_key = parse_tokens({"run", "--operation", "translate", "--param", "=French"});
    ASSERT_TRUE(is_error(no_key));
    EXPECT_EQ(get_error(no_key).code, "invalid_param");
}

TEST(CliParserTest, FailsWhenTimeoutNotNumeric) {
    auto result = parse_tokens({"test", "--timeout", "10s"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenTimeoutOutOfBounds) {
    auto result = parse_tokens({"test", "--timeout", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, ParsesRunRequest) {
    auto result = parse_tokens({"run", "--operation", "translate", "--text", "Hallo Welt",
                                "--param", "language=English", "--param", "note=a=b",
                                "--provider", "claude", "--timeout", "45",
                                "--config", "~/.askai.json", "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_EQ(req.command, CliCommand::Run);
    EXPECT_EQ(req.operation_id, "translate");
    ASSERT_TRUE(req.text.has_value());
    EXPECT_EQ(*req.text, "Hallo Welt");
    EXPECT_EQ(req.params.at("language"), "English");
    EXPECT_EQ(req.params.at("note"), "a=b");
    ASSERT_TRUE(req.provider_id.has_value());
    EXPECT_EQ(*req.provider_id, "claude");
    ASSERT_TRUE(req.timeout.has_value());
    EXPECT_EQ(*req.timeout, std::chrono::seconds(45));
    ASSERT_TRUE(req.config_path.has_value());
    EXPECT_EQ(*req.config_path, "~/.askai.json");
    EXPECT_TRUE(req.verbose);
}

TEST(CliParserTest, RunWithoutTextReadsStdin) {
    auto result = parse_tokens({"run", "--operation", "summarize"});
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(get_value(result).text.has_value());
    EXPECT_FALSE(get_value(result).verbose);
}

TEST(CliParserTest, ParsesOtherCommands) {
    auto call = parse_tokens({"call", "--prompt", "Say hi"});
    ASSERT_FALSE(is_error(call));
    EXPECT_EQ(get_value(call).command, CliCommand::Call);
    EXPECT_EQ(get_value(call).prompt, "Say hi");
    EXPECT_FALSE(get_value(call).provider_id.has_value());

    auto test = parse_tokens({"test"});
    ASSERT_FALSE(is_error(test));
    EXPECT_EQ(get_value(test).command, CliCommand::Test);

    auto operations = parse_tokens({"operations"});
    ASSERT_FALSE(is_error(operations));
    EXPECT_EQ(get_value(operations).command, CliCommand::Operations);

    auto check = parse_tokens({"check", "--config", "cfg.json"});
    ASSERT_FALSE(is_error(check));
    EXPECT_EQ(get_value(check).command, CliCommand::Check);
}

}  // namespace
