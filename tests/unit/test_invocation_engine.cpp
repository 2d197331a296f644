#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "config/config_loader.hpp"
#include "core/errors/askai_errors.hpp"
#include "core/logging/logger.hpp"
#include "engine/invocation_engine.hpp"
#include "fake_process_launcher.hpp"
#include "process/posix_process_launcher.hpp"

namespace {

using askai::config::AppConfig;
using askai::core::errors::get_error;
using askai::core::errors::get_value;
using askai::core::errors::is_error;
using askai::engine::CallOptions;
using askai::engine::InvocationEngine;
using askai::protocol::InvocationRequest;
using askai::registry::ProviderSpec;
using askai::testing::FakeBehavior;
using askai::testing::FakeProcessLauncher;

using namespace std::chrono_literals;

ProviderSpec make_provider(const std::string& id, int priority) {
    ProviderSpec spec;
    spec.id = id;
    spec.program = id;
    spec.args = {"-p"};
    spec.priority = priority;
    return spec;
}

AppConfig test_config() {
    AppConfig config = askai::config::default_config();
    config.providers = {make_provider("gemini", 0), make_provider("claude", 1),
                        make_provider("codex", 2)};
    config.default_provider = "gemini";
    config.fallback_provider = "claude";
    config.timeout = 2s;
    return config;
}

class InvocationEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        askai::core::logging::Logger::get().set_level(askai::core::logging::LogLevel::ERROR);
        launcher_ = std::make_shared<FakeProcessLauncher>();
    }

    std::unique_ptr<InvocationEngine> make_engine(AppConfig config = test_config()) {
        return std::make_unique<InvocationEngine>(std::move(config), launcher_);
    }

    std::shared_ptr<FakeProcessLauncher> launcher_;
};

TEST_F(InvocationEngineTest, KnownOperationsSucceed) {
    launcher_->script("gemini", FakeBehavior::reply("Polished text\n"));
    auto engine = make_engine();

    for (const char* op : {"improve", "fix_grammar", "summarize", "explain", "continue"}) {
        const auto outcome = engine->perform_operation(op, "Some input text.");
        EXPECT_TRUE(outcome.success) << op;
        EXPECT_EQ(outcome.text, "Polished text") << op;
    }
    const auto translated =
        engine->perform_operation("translate", "Hallo", {{"language", "English"}});
    EXPECT_TRUE(translated.success);
}

TEST_F(InvocationEngineTest, PromptIsSentAsTrailingArgument) {
    launcher_->script("gemini", FakeBehavior::reply("ok"));
    auto engine = make_engine();

    ASSERT_TRUE(engine->perform_operation("summarize", "Long text").success);
    const auto launches = launcher_->launches();
    ASSERT_EQ(launches.size(), 1u);
    ASSERT_EQ(launches[0].args.size(), 2u);
    EXPECT_EQ(launches[0].args[0], "-p");
    EXPECT_EQ(launches[0].args[1],
              "Please provide a concise summary of the following text:\n\nLong text");
}

TEST_F(InvocationEngineTest, EmptyOperationIsRejected) {
    auto engine = make_engine();
    const auto outcome = engine->perform_operation("", "any text");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.text, "No operation specified");
    EXPECT_TRUE(launcher_->launches().empty());
}

TEST_F(InvocationEngineTest, EmptyTextIsRejected) {
    auto engine = make_engine();
    const auto outcome = engine->perform_operation("improve", "");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.text, "No text provided");

    auto blank = engine->perform(InvocationRequest{"improve", "  \n ", {}, std::nullopt});
    ASSERT_TRUE(is_error(blank));
    EXPECT_EQ(get_error(blank).code, "no_text_provided");
    EXPECT_TRUE(launcher_->launches().empty());
}

TEST_F(InvocationEngineTest, UnknownOperationAndMissingParameter) {
    auto engine = make_engine();
    auto unknown = engine->perform(InvocationRequest{"haiku", "text", {}, std::nullopt});
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_operation");

    auto missing = engine->perform(InvocationRequest{"translate", "text", {}, std::nullopt});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_parameter");
    EXPECT_TRUE(launcher_->launches().empty());
}

TEST_F(InvocationEngineTest, CallWithUnknownProvider) {
    auto engine = make_engine();
    const auto outcome = engine->call("invalid-provider-id", "prompt");
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.text.find("Unknown provider"), std::string::npos);
    EXPECT_TRUE(launcher_->launches().empty());
}

TEST_F(InvocationEngineTest, FallsBackToNextProvider) {
    launcher_->script("gemini", FakeBehavior::fail(1, "quota exceeded"));
    launcher_->script("claude", FakeBehavior::reply("From claude"));
    auto engine = make_engine();

    const auto outcome = engine->perform_operation("improve", "text");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.text, "From claude");
    EXPECT_EQ(launcher_->launched_programs(),
              (std::vector<std::string>{"gemini", "claude"}));
}

TEST_F(InvocationEngineTest, ExhaustedChainReturnsLastFailure) {
    launcher_->script("gemini", FakeBehavior::fail(1, "gemini broke"));
    launcher_->script("claude", FakeBehavior::reply(""));
    launcher_->script("codex", FakeBehavior::fail(2, "codex broke"));
    auto engine = make_engine();

    auto result = engine->perform(InvocationRequest{"improve", "text", {}, std::nullopt});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "process_error");
    EXPECT_EQ(get_error(result).message, "codex broke");
    EXPECT_EQ(launcher_->launched_programs(),
              (std::vector<std::string>{"gemini", "claude", "codex"}));

    const auto called = engine->call("", "raw prompt");
    EXPECT_FALSE(called.success);
    EXPECT_EQ(called.text, "codex: codex broke");
}

TEST_F(InvocationEngineTest, RequestedProviderGoesFirst) {
    launcher_->script("codex", FakeBehavior::reply("From codex"));
    auto engine = make_engine();

    InvocationRequest request{"improve", "text", {}, std::string("codex")};
    auto result = engine->perform(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "From codex");
    EXPECT_EQ(launcher_->launched_programs(), (std::vector<std::string>{"codex"}));
}

TEST_F(InvocationEngineTest, TimeoutAdvancesChainAndKillsProcess) {
    launcher_->script("gemini", FakeBehavior::hang());
    launcher_->script("claude", FakeBehavior::reply("late but fine"));
    AppConfig config = test_config();
    config.providers[0].timeout = 200ms;
    auto engine = make_engine(config);

    const auto outcome = engine->perform_operation("improve", "text");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.text, "late but fine");
    EXPECT_EQ(launcher_->killed_programs(), (std::vector<std::string>{"gemini"}));
    EXPECT_FALSE(launcher_->any_running());
}

TEST_F(InvocationEngineTest, TimeoutOnLastProviderIsReported) {
    launcher_->script("gemini", FakeBehavior::hang());
    auto engine = make_engine();

    CallOptions options;
    options.allow_fallback = false;
    options.timeout = 150ms;
    const auto outcome = engine->call("gemini", "prompt", options);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.text, "gemini: operation timed out after 0.15s");
    EXPECT_EQ(launcher_->launched_programs(), (std::vector<std::string>{"gemini"}));
    EXPECT_FALSE(launcher_->any_running());
}

TEST_F(InvocationEngineTest, MaxAttemptsTruncatesChain) {
    launcher_->script("gemini", FakeBehavior::fail(1, "no"));
    launcher_->script("claude", FakeBehavior::fail(1, "still no"));
    launcher_->script("codex", FakeBehavior::reply("never reached"));
    AppConfig config = test_config();
    config.max_attempts = 2;
    auto engine = make_engine(config);

    const auto outcome = engine->perform_operation("improve", "text");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.text, "still no");
    EXPECT_EQ(launcher_->launched_programs(),
              (std::vector<std::string>{"gemini", "claude"}));
}

TEST_F(InvocationEngineTest, RepeatedCallsClassifyTheSameWay) {
    launcher_->script("gemini", FakeBehavior::fail(3, "", ""));
    launcher_->script("claude", FakeBehavior::reply(" \n"));
    launcher_->script("codex", FakeBehavior::reply(" \n"));
    auto engine = make_engine();

    for (int i = 0; i < 3; ++i) {
        auto result = engine->perform(InvocationRequest{"explain", "text", {}, std::nullopt});
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).code, "empty_response");
        EXPECT_EQ(get_error(result).message, "empty output");
    }
}

TEST_F(InvocationEngineTest, ConcurrentRequestsRunIndependently) {
    launcher_->script("gemini", FakeBehavior::reply("done", 300ms));
    auto engine = make_engine();

    const auto started = std::chrono::steady_clock::now();
    std::vector<std::future<askai::protocol::OperationOutcome>> pending;
    for (int i = 0; i < 4; ++i) {
        pending.push_back(engine->perform_operation_async("improve", "text " + std::to_string(i)));
    }
    for (auto& future : pending) {
        const auto outcome = future.get();
        EXPECT_TRUE(outcome.success);
        EXPECT_EQ(outcome.text, "done");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1000ms);
    EXPECT_EQ(engine->in_flight_count(), 0u);
}

TEST_F(InvocationEngineTest, ShutdownCancelsInFlightRequests) {
    launcher_->script("gemini", FakeBehavior::hang());
    launcher_->script("claude", FakeBehavior::reply("should not run"));
    auto engine = make_engine();

    auto pending = engine->perform_operation_async("improve", "text");
    std::this_thread::sleep_for(100ms);
    engine->shutdown();

    const auto outcome = pending.get();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.text, "Operation cancelled");
    EXPECT_EQ(launcher_->launched_programs(), (std::vector<std::string>{"gemini"}));
    EXPECT_FALSE(launcher_->any_running());

    const auto after = engine->perform_operation("improve", "text");
    EXPECT_FALSE(after.success);
    EXPECT_EQ(after.text, "Engine is shut down");
    engine->shutdown();
}

TEST_F(InvocationEngineTest, LaunchErrorFallsBack) {
    launcher_->script("gemini", FakeBehavior::launch_error());
    launcher_->script("claude", FakeBehavior::reply("recovered"));
    auto engine = make_engine();

    const auto outcome = engine->perform_operation("improve", "text");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.text, "recovered");
}

TEST(InvocationEngineRealProcessTest, RunsShellProvider) {
    askai::core::logging::Logger::get().set_level(askai::core::logging::LogLevel::ERROR);
    AppConfig config = askai::config::default_config();
    ProviderSpec echo;
    echo.id = "echo";
    echo.program = "/bin/sh";
    echo.args = {"-c", "printf 'reply: %s' \"$1\"", "sh", "${prompt}"};
    config.providers = {echo};
    config.default_provider = "echo";
    InvocationEngine engine(config, std::make_shared<askai::process::PosixProcessLauncher>());

    const auto outcome = engine.call("", "hello");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.text, "reply: hello");
}

}  // namespace
