//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and the initialize handshake payload
//==========================================================================================================

#pragma once

#include "mcpexec/JSONRPCTypes.h"
#include <memory>
#include <string>

namespace mcpexec {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version sent in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Default clientInfo.name
constexpr const char* CLIENT_NAME = "mcpexec";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
}

// Levels carried by notifications/message that get a dedicated color tag
namespace LogLevels {
    constexpr const char* Error = "error";
    constexpr const char* Warning = "warning";
    constexpr const char* Alert = "alert";
    constexpr const char* Info = "info";
}

//==========================================================================================================
// BuildInitializeParams
// Purpose: Builds {"clientInfo":{name,version},"protocolVersion":PROTOCOL_VERSION,"capabilities":{}}.
//==========================================================================================================
inline JSONValue BuildInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(clientInfo.name);
    info["version"] = std::make_shared<JSONValue>(clientInfo.version);

    JSONValue::Object params;
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));
    params["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue(std::move(params));
}

} // namespace mcpexec
