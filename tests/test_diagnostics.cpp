//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_diagnostics.cpp
// Purpose: Rendering of server log notifications and captured stderr
//==========================================================================================================

#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "mcpexec/Diagnostics.h"
#include "mcpexec/JSONRPCTypes.h"

using namespace mcpexec;

TEST(Diagnostics, LevelTagsAndColors) {
    EXPECT_EQ(FormatLogMessageLine("error", "e", true), "\033[31m[ERROR] e\033[0m");
    EXPECT_EQ(FormatLogMessageLine("warning", "w", true), "\033[33m[WARNING] w\033[0m");
    EXPECT_EQ(FormatLogMessageLine("alert", "a", true), "\033[35m[ALERT] a\033[0m");
    EXPECT_EQ(FormatLogMessageLine("info", "i", true), "\033[36m[INFO] i\033[0m");
    EXPECT_EQ(FormatLogMessageLine("debug", "d", true), "\033[37m[debug] d\033[0m");
}

TEST(Diagnostics, PlainWhenColorDisabled) {
    EXPECT_EQ(FormatLogMessageLine("warning", "disk low", false), "[WARNING] disk low");
    EXPECT_EQ(FormatLogMessageLine("notice", "n", false), "[notice] n");
}

TEST(Diagnostics, LogNotificationPrintsOneLine) {
    std::ostringstream out;
    ServerLogPresenter presenter(out, false);
    const std::string raw = R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"warning","data":"careful"}})";
    JSONValue v = ParseJSON(raw);
    presenter.PrintNotification(std::get<JSONValue::Object>(v.value), raw);
    EXPECT_EQ(out.str(), "[WARNING] careful\n");
}

TEST(Diagnostics, StructuredLogDataIsSerialized) {
    std::ostringstream out;
    ServerLogPresenter presenter(out, false);
    const std::string raw = R"({"method":"notifications/message","params":{"level":"info","data":{"k":1}}})";
    JSONValue v = ParseJSON(raw);
    presenter.PrintNotification(std::get<JSONValue::Object>(v.value), raw);
    EXPECT_EQ(out.str(), "[INFO] {\"k\":1}\n");
}

TEST(Diagnostics, LogNotificationWithoutParamsIsSilent) {
    std::ostringstream out;
    ServerLogPresenter presenter(out, true);
    const std::string raw = R"({"method":"notifications/message"})";
    JSONValue v = ParseJSON(raw);
    presenter.PrintNotification(std::get<JSONValue::Object>(v.value), raw);
    EXPECT_TRUE(out.str().empty());
}

TEST(Diagnostics, OtherNotificationsEchoRawLine) {
    std::ostringstream out;
    ServerLogPresenter presenter(out, true);
    const std::string raw = R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"progress":50}})";
    JSONValue v = ParseJSON(raw);
    presenter.PrintNotification(std::get<JSONValue::Object>(v.value), raw);
    EXPECT_EQ(out.str(), "[Notification] " + raw + "\n");
}

TEST(Diagnostics, StderrEchoSkipsEmptyLines) {
    std::ostringstream out;
    ServerLogPresenter presenter(out, true);
    presenter.EchoStderr("starting\n\nready\r\npartial");
    EXPECT_EQ(out.str(), "[>] starting\n[>] ready\n[>] partial\n");
}
