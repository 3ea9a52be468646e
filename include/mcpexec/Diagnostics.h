//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Diagnostics.h
// Purpose: Presentation of server notifications and captured server stderr
//==========================================================================================================

#pragma once

#include <ostream>
#include <string>

#include "mcpexec/JSONRPCTypes.h"

namespace mcpexec {

//==========================================================================================================
// FormatLogMessageLine
// Purpose: Renders one notifications/message event, e.g. "\033[33m[WARNING] disk low\033[0m".
// Args:
//   level: "error", "warning", "alert" and "info" get dedicated tags; other values are shown verbatim.
//   data: Message text.
//   color: When false the ANSI escape sequences are omitted.
// Returns:
//   The line without a trailing newline.
//==========================================================================================================
std::string FormatLogMessageLine(const std::string& level, const std::string& data, bool color);

//==========================================================================================================
// ServerLogPresenter
// Purpose: Writes server-originated diagnostics to a stream (std::cerr by default in the transport).
//==========================================================================================================
class ServerLogPresenter {
public:
    ServerLogPresenter(std::ostream& out, bool color) : out_(&out), color_(color) {}

    //==========================================================================================================
    // PrintNotification
    // Purpose: Handles a line already classified as a server notification.
    // Args:
    //   message: Parsed notification object.
    //   rawLine: The line as received, shown verbatim for notifications other than notifications/message.
    //==========================================================================================================
    void PrintNotification(const JSONValue::Object& message, const std::string& rawLine);

    void PrintLogMessage(const std::string& level, const std::string& data);

    // One "[>] <line>" per non-empty line of captured stderr.
    void EchoStderr(const std::string& captured);

    void SetStream(std::ostream& out) { out_ = &out; }
    void SetColor(bool color) { color_ = color; }

private:
    std::ostream* out_;
    bool color_;
};

} // namespace mcpexec
