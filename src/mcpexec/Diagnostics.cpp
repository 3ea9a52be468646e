//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Diagnostics.cpp
// Purpose: Server notification and stderr presentation
//==========================================================================================================

#include "mcpexec/Diagnostics.h"
#include "mcpexec/Protocol.h"

namespace mcpexec {

std::string FormatLogMessageLine(const std::string& level, const std::string& data, bool color) {
    const char* ansi = "\033[37m";
    std::string tag = level;
    if (level == LogLevels::Error) {
        ansi = "\033[31m"; tag = "ERROR";
    } else if (level == LogLevels::Warning) {
        ansi = "\033[33m"; tag = "WARNING";
    } else if (level == LogLevels::Alert) {
        ansi = "\033[35m"; tag = "ALERT";
    } else if (level == LogLevels::Info) {
        ansi = "\033[36m"; tag = "INFO";
    }
    std::string line = "[" + tag + "] " + data;
    if (!color) {
        return line;
    }
    return ansi + line + "\033[0m";
}

void ServerLogPresenter::PrintNotification(const JSONValue::Object& message, const std::string& rawLine) {
    auto method = message.find("method");
    const bool isLog = method != message.end() && method->second &&
                       std::holds_alternative<std::string>(method->second->value) &&
                       std::get<std::string>(method->second->value) == Methods::Log;
    if (!isLog) {
        (*out_) << "[Notification] " << rawLine << '\n';
        out_->flush();
        return;
    }

    // A log event without a params object is not shown
    auto params = message.find("params");
    if (params == message.end() || !params->second || !params->second->IsObject()) {
        return;
    }
    std::string level;
    if (const JSONValue* l = params->second->Find("level")) {
        if (const auto* s = std::get_if<std::string>(&l->value)) {
            level = *s;
        }
    }
    std::string data;
    if (const JSONValue* d = params->second->Find("data")) {
        if (const auto* s = std::get_if<std::string>(&d->value)) {
            data = *s;
        } else if (!d->IsNull()) {
            data = SerializeJSONValue(*d);
        }
    }
    PrintLogMessage(level, data);
}

void ServerLogPresenter::PrintLogMessage(const std::string& level, const std::string& data) {
    (*out_) << FormatLogMessageLine(level, data, color_) << '\n';
    out_->flush();
}

void ServerLogPresenter::EchoStderr(const std::string& captured) {
    std::size_t start = 0;
    while (start < captured.size()) {
        std::size_t end = captured.find('\n', start);
        if (end == std::string::npos) {
            end = captured.size();
        }
        std::string line = captured.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            (*out_) << "[>] " << line << '\n';
        }
        start = end + 1;
    }
    out_->flush();
}

} // namespace mcpexec
