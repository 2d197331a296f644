#include <iostream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/logging/logger.hpp"

namespace {

using askai::core::logging::LogLevel;
using askai::core::logging::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = std::clog.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::clog.rdbuf(previous_);
        Logger::get().set_context("");
        Logger::get().set_level(LogLevel::INFO);
    }

    std::ostringstream captured_;
    std::streambuf* previous_ = nullptr;
};

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
    Logger::get().set_context("");
    Logger::get().set_level(LogLevel::WARN);

    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_WARN("shown warning");
    LOG_ERROR("shown error");

    const std::string text = captured_.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] shown warning\n"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] shown error\n"), std::string::npos);
}

TEST_F(LoggerTest, PrefixesContextTag) {
    Logger::get().set_level(LogLevel::DEBUG);
    Logger::get().set_context("req-1234abcd");

    LOG_DEBUG("launching codex");

    EXPECT_NE(captured_.str().find("[DEBUG] [req-1234abcd] launching codex\n"), std::string::npos);
}

}  // namespace
