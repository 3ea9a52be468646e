//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logging_env.cpp
// Purpose: Logger placeholder formatting, level parsing and environment helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"

TEST(Logger, FormatsPlaceholdersInOrder) {
    EXPECT_EQ(Logger::format("a={} b={}", 1, std::string("two")), "a=1 b=two");
    EXPECT_EQ(Logger::format("flag={}", true), "flag=true");
    EXPECT_EQ(Logger::format("no args"), "no args");
}

TEST(Logger, EscapedBracesAndSurplusPlaceholders) {
    EXPECT_EQ(Logger::format("{{literal}} {}", 5), "{literal} 5");
    EXPECT_EQ(Logger::format("{} {}", "only"), "only {}");
}

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("WARNING"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::LOG_INFO_LEVEL);
}

TEST(EnvVars, FlagsAndUnsignedValues) {
    ::setenv("MCPEXEC_TEST_FLAG", "on", 1);
    ::setenv("MCPEXEC_TEST_UINT", "1500", 1);
    EXPECT_TRUE(GetEnvFlag("MCPEXEC_TEST_FLAG", false));
    EXPECT_EQ(GetEnvUint("MCPEXEC_TEST_UINT", 7), 1500u);

    ::setenv("MCPEXEC_TEST_FLAG", "0", 1);
    ::setenv("MCPEXEC_TEST_UINT", "x", 1);
    EXPECT_FALSE(GetEnvFlag("MCPEXEC_TEST_FLAG", true));
    EXPECT_EQ(GetEnvUint("MCPEXEC_TEST_UINT", 7), 7u);

    ::unsetenv("MCPEXEC_TEST_FLAG");
    ::unsetenv("MCPEXEC_TEST_UINT");
    EXPECT_TRUE(GetEnvFlag("MCPEXEC_TEST_FLAG", true));
    EXPECT_EQ(GetEnvOrDefault("MCPEXEC_TEST_UINT", "dflt"), "dflt");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "dflt"), "dflt");
}

TEST(Logger, SetLogLevelFiltersMacros) {
    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogLevel(LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);
    testing::internal::CaptureStderr();
    LOG_WARN("suppressed {}", 1);
    LOG_ERROR("shown {}", 2);
    const std::string out = testing::internal::GetCapturedStderr();
    EXPECT_EQ(out.find("suppressed"), std::string::npos);
    EXPECT_NE(out.find("shown 2"), std::string::npos);
    Logger::setLogLevel(saved);
}
