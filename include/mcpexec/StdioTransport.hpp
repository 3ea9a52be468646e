//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Client transport that runs an MCP server as a child process and talks JSON-RPC over its stdio
//==========================================================================================================
#pragma once

#include "mcpexec/Protocol.h"
#include "mcpexec/Transport.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace mcpexec {

// Whether the child process outlives a single Execute call.
enum class SessionMode {
    Ephemeral,   // spawn, handshake, one request, shut down
    Persistent   // spawn and handshake once, reuse for every call
};

// Upper bound applied to every configured shutdown timeout (one hour).
constexpr uint64_t MAX_SHUTDOWN_TIMEOUT_MS = 3600000;

//==========================================================================================================
// StdioTransportOptions
// Purpose: Behavior switches for StdioTransport.
// Fields:
//   debug: Trace every send, receive and shutdown event through the Logger.
//   mode: Ephemeral or Persistent session handling.
//   showServerLogs: Echo captured server stderr as "[>] <line>" on the diagnostic stream.
//   strictIds: Treat a response carrying an unexpected id as malformed instead of skipping it.
//   shutdownTimeout: How long an ephemeral child may take to exit after stdin closes.
//                    Setters, factory config and environment clamp it to MAX_SHUTDOWN_TIMEOUT_MS.
//   clientInfo: Sent as clientInfo in the initialize request.
//   diagnostics: Stream for server notifications and stderr echo; nullptr means std::cerr.
//   colorNotifications: ANSI colors on notifications/message lines.
//==========================================================================================================
struct StdioTransportOptions {
    bool debug{false};
    SessionMode mode{SessionMode::Ephemeral};
    bool showServerLogs{false};
    bool strictIds{false};
    std::chrono::milliseconds shutdownTimeout{1000};
    Implementation clientInfo;
    std::ostream* diagnostics{nullptr};
    bool colorNotifications{true};

    StdioTransportOptions();

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by MCP_DEBUG, MCP_SHOW_SERVER_LOGS and MCP_STDIO_SHUTDOWN_TIMEOUT_MS.
    //==========================================================================================================
    static StdioTransportOptions FromEnvironment();
};

//==========================================================================================================
// ParseStdioTransportConfig
// Purpose: Applies "key=value" options separated by ';' or whitespace on top of base.
// Keys:
//   debug, persistent, show_server_logs, strict_ids: 1/0, true/false, yes/no, on/off
//   shutdown_timeout_ms: unsigned integer
//   client_name, client_version: clientInfo sent during initialize
// Notes:
//   Unknown keys and malformed values are logged and ignored.
//==========================================================================================================
StdioTransportOptions ParseStdioTransportConfig(const std::string& config, StdioTransportOptions base);

//==========================================================================================================
// StdioTransport
// Purpose: Spawns the server lazily on the first Execute, performs the initialize handshake once per
//          process, and correlates each response with the request that produced it.
// Notes:
//   - Request ids start at 1 and keep increasing for the lifetime of the transport, across respawns.
//   - Server notifications received while waiting are printed and skipped.
//   - Not thread-safe; use one transport per concurrent caller.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::vector<std::string> command);
    StdioTransport(std::vector<std::string> command, StdioTransportOptions options);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Execute
    // Purpose: Sends method/params to the server and returns the matching result.
    // Throws:
    //   errors::SpawnError, SerializationError, TransportWriteError, TransportReadError,
    //   MalformedMessageError, RPCError, CommandExitError (ephemeral mode only).
    //==========================================================================================================
    JSONValue Execute(const std::string& method, const std::optional<JSONValue>& params) override;

    // Kills and reaps a live child process, if any.
    void Close() override;

    ////////////////////////////////////////// Configuration //////////////////////////////////////////
    //==========================================================================================================
    // SetSessionMode
    // Purpose: Switches between ephemeral and persistent handling. Leaving persistent mode tears down
    //          the live session.
    //==========================================================================================================
    void SetSessionMode(SessionMode mode);
    SessionMode GetSessionMode() const;

    void SetDebug(bool enabled);
    void SetShowServerLogs(bool enabled);
    void SetShutdownTimeoutMs(uint64_t timeoutMs);
    void SetStrictIdMatching(bool enabled);
    void SetDiagnosticStream(std::ostream& out);
    void SetClientInfo(const Implementation& clientInfo);

    const StdioTransportOptions& GetOptions() const;

    ////////////////////////////////////////// Introspection //////////////////////////////////////////
    // Id the next request will carry.
    int64_t GetNextRequestId() const;

    bool HasLiveSession() const;

    // Pid of the live child, or -1 when there is none.
    int GetServerPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates StdioTransport instances from a command and a configuration string
//          (see ParseStdioTransportConfig). Environment defaults apply first.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::vector<std::string>& command,
                                                const std::string& config) override;
};

} // namespace mcpexec
