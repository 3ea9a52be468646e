//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Handshake, request/response correlation and child lifecycle for the stdio transport
//==========================================================================================================

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpexec/Diagnostics.h"
#include "mcpexec/JSONRPCTypes.h"
#include "mcpexec/ProcessSession.hpp"
#include "mcpexec/StdioTransport.hpp"
#include "mcpexec/errors/Errors.h"
#include "mcpexec/version.h"

// Debug tracing gated on the transport's debug option rather than the global log level
#define TRACE(fmt, ...) if (options.debug) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)

namespace mcpexec {

namespace {

std::chrono::milliseconds clampShutdownTimeout(uint64_t timeoutMs, const char* source) {
    if (timeoutMs > MAX_SHUTDOWN_TIMEOUT_MS) {
        LOG_WARN("StdioTransport: {} of {}ms exceeds the maximum, using {}ms", source, timeoutMs,
                 MAX_SHUTDOWN_TIMEOUT_MS);
        timeoutMs = MAX_SHUTDOWN_TIMEOUT_MS;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(timeoutMs));
}

// JSON-RPC params are structured; checked before any process is spawned.
void validateParams(const std::optional<JSONValue>& params) {
    if (!params.has_value() || params->IsNull()) return;
    if (!params->IsObject() && !std::holds_alternative<JSONValue::Array>(params->value)) {
        throw errors::SerializationError("error marshaling request: params must be an object or array");
    }
}

} // namespace

StdioTransportOptions::StdioTransportOptions()
    : clientInfo(CLIENT_NAME, getVersionString()) {}

StdioTransportOptions StdioTransportOptions::FromEnvironment() {
    StdioTransportOptions o;
    o.debug = GetEnvFlag("MCP_DEBUG", false);
    o.showServerLogs = GetEnvFlag("MCP_SHOW_SERVER_LOGS", false);
    o.shutdownTimeout = clampShutdownTimeout(
        GetEnvUint("MCP_STDIO_SHUTDOWN_TIMEOUT_MS", static_cast<uint64_t>(o.shutdownTimeout.count())),
        "MCP_STDIO_SHUTDOWN_TIMEOUT_MS");
    return o;
}

class StdioTransport::Impl {
public:
    std::vector<std::string> command;
    StdioTransportOptions options;
    ServerLogPresenter presenter;
    std::unique_ptr<ProcessSession> session;
    int64_t nextId{1};
    // stderr already echoed for the live session; still counts toward the exit check
    std::string echoedStderr;

    Impl(std::vector<std::string> cmd, StdioTransportOptions opts)
        : command(std::move(cmd)),
          options(std::move(opts)),
          presenter(options.diagnostics ? *options.diagnostics : std::cerr, options.colorNotifications) {}

    std::string describeCommand() const {
        std::string s = "[";
        for (std::size_t i = 0; i < command.size(); ++i) {
            if (i > 0) s += " ";
            s += command[i];
        }
        return s + "]";
    }

    void teardown() {
        if (session) {
            TRACE("Tearing down session for pid {}", session->GetPid());
        }
        session.reset();
        echoedStderr.clear();
    }

    void ensureSession() {
        if (session) {
            return;
        }
        TRACE("Executing command: {}", describeCommand());
        auto fresh = std::make_unique<ProcessSession>();
        fresh->Spawn(command);
        session = std::move(fresh);
    }

    void echoStderr() {
        if (!options.showServerLogs || !session) {
            return;
        }
        std::string captured = session->DrainStderr();
        if (captured.empty()) {
            return;
        }
        presenter.EchoStderr(captured);
        echoedStderr += captured;
    }

    void writeMessage(const JSONRPCMessage& message) {
        const std::string line = message.Serialize();
        TRACE("Preparing to send request: {}", line);
        session->WriteLine(line);
        TRACE("Wrote {} bytes", line.size() + 1);
    }

    // Returns the id the request was sent with.
    int64_t sendRequest(const std::string& method, const std::optional<JSONValue>& params) {
        std::optional<JSONValue> wireParams;
        if (params.has_value() && !params->IsNull()) {
            wireParams = params;
        }
        const int64_t id = nextId++;
        JSONRPCRequest request(id, method, std::move(wireParams));
        writeMessage(request);
        return id;
    }

    JSONValue readResponse(int64_t expectedId) {
        while (true) {
            const std::string line = session->ReadLine();
            TRACE("Read from stdout: {}", line);

            JSONValue parsed;
            try {
                parsed = ParseJSON(line);
            } catch (const std::runtime_error& e) {
                throw errors::MalformedMessageError(
                    std::string("error unmarshaling message: ") + e.what() + ", response: " + line, line);
            }
            const auto* obj = std::get_if<JSONValue::Object>(&parsed.value);
            if (!obj) {
                throw errors::MalformedMessageError(
                    "error unmarshaling message: not a JSON object, response: " + line, line);
            }

            if (IsServerNotification(*obj)) {
                presenter.PrintNotification(*obj, line);
                continue;
            }

            JSONRPCResponse response;
            if (!response.FromObject(*obj)) {
                throw errors::MalformedMessageError(
                    "error unmarshaling response: invalid id or error member, response: " + line, line);
            }
            if (response.IsError()) {
                throw errors::RPCError(errors::mcpErrorFromResponse(response).value());
            }
            if (response.id == expectedId) {
                TRACE("Successfully parsed response with matching ID: {}", expectedId);
                return response.result.value_or(JSONValue(nullptr));
            }

            const std::string got = response.id ? std::to_string(*response.id) : std::string("null");
            if (options.strictIds) {
                throw errors::MalformedMessageError(
                    "unexpected response id " + got + ", expecting " + std::to_string(expectedId), line);
            }
            TRACE("Received response for request ID {}, expecting {}. Continuing to read.", got, expectedId);
        }
    }

    void failHandshake(errors::TransportError& e, const char* context) {
        echoStderr();
        e.AddContext(context);
        TRACE("Initialization failed: {}", e.what());
        teardown();
    }

    void ensureInitialized() {
        if (session->IsInitialized()) {
            return;
        }
        TRACE("Starting initialization");

        int64_t initId = 0;
        try {
            initId = sendRequest(Methods::Initialize, BuildInitializeParams(options.clientInfo));
        } catch (errors::TransportError& e) {
            failHandshake(e, "init request failed");
            throw;
        }
        try {
            readResponse(initId);
        } catch (errors::TransportError& e) {
            failHandshake(e, "init response failed");
            throw;
        }
        try {
            writeMessage(JSONRPCNotification(Methods::Initialized));
        } catch (errors::TransportError& e) {
            failHandshake(e, "init notification failed");
            throw;
        }

        echoStderr();
        session->MarkInitialized();
        TRACE("Initialization successful, sending method request");
    }

    // Ephemeral shutdown: close stdin, wait bounded, kill on timeout.
    JSONValue finishEphemeral(JSONValue result) {
        session->CloseStdin();
        const ExitOutcome outcome = session->WaitOrKill(options.shutdownTimeout);
        if (outcome.killed) {
            TRACE("Command timed out after {}ms", options.shutdownTimeout.count());
            teardown();
            return result;
        }
        TRACE("Command completed with {}", outcome.status.Describe());
        // The drain thread may still be appending the last bytes
        if (!session->WaitStderrClosed(options.shutdownTimeout)) {
            TRACE("stderr still open after exit of pid {}", session->GetPid());
        }
        echoStderr();
        if (!outcome.status.Success()) {
            std::string captured = echoedStderr + session->DrainStderr();
            if (!captured.empty()) {
                const std::string description = outcome.status.Describe();
                teardown();
                throw errors::CommandExitError(description, std::move(captured), std::move(result));
            }
        }
        teardown();
        return result;
    }

    JSONValue execute(const std::string& method, const std::optional<JSONValue>& params) {
        validateParams(params);
        ensureSession();
        try {
            ensureInitialized();
            const int64_t id = sendRequest(method, params);
            JSONValue result;
            try {
                result = readResponse(id);
            } catch (const errors::TransportError&) {
                echoStderr();
                throw;
            }
            echoStderr();
            if (options.mode == SessionMode::Persistent) {
                return result;
            }
            return finishEphemeral(std::move(result));
        } catch (const errors::RPCError&) {
            // The stream is still in sync after a structured error
            if (options.mode == SessionMode::Ephemeral) {
                teardown();
            }
            throw;
        } catch (const errors::TransportError&) {
            teardown();
            throw;
        }
    }
};

StdioTransport::StdioTransport(std::vector<std::string> command)
    : StdioTransport(std::move(command), StdioTransportOptions::FromEnvironment()) {}

StdioTransport::StdioTransport(std::vector<std::string> command, StdioTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(command), std::move(options))) {}

StdioTransport::~StdioTransport() = default;

JSONValue StdioTransport::Execute(const std::string& method, const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    return pImpl->execute(method, params);
}

void StdioTransport::Close() {
    FUNC_SCOPE();
    pImpl->teardown();
}

void StdioTransport::SetSessionMode(SessionMode mode) {
    if (pImpl->options.mode == SessionMode::Persistent && mode == SessionMode::Ephemeral) {
        pImpl->teardown();
    }
    pImpl->options.mode = mode;
}

SessionMode StdioTransport::GetSessionMode() const {
    return pImpl->options.mode;
}

void StdioTransport::SetDebug(bool enabled) {
    pImpl->options.debug = enabled;
}

void StdioTransport::SetShowServerLogs(bool enabled) {
    pImpl->options.showServerLogs = enabled;
}

void StdioTransport::SetShutdownTimeoutMs(uint64_t timeoutMs) {
    pImpl->options.shutdownTimeout = clampShutdownTimeout(timeoutMs, "shutdown timeout");
}

void StdioTransport::SetStrictIdMatching(bool enabled) {
    pImpl->options.strictIds = enabled;
}

void StdioTransport::SetDiagnosticStream(std::ostream& out) {
    pImpl->options.diagnostics = &out;
    pImpl->presenter.SetStream(out);
}

void StdioTransport::SetClientInfo(const Implementation& clientInfo) {
    pImpl->options.clientInfo = clientInfo;
}

const StdioTransportOptions& StdioTransport::GetOptions() const {
    return pImpl->options;
}

int64_t StdioTransport::GetNextRequestId() const {
    return pImpl->nextId;
}

bool StdioTransport::HasLiveSession() const {
    return pImpl->session != nullptr;
}

int StdioTransport::GetServerPid() const {
    return pImpl->session ? pImpl->session->GetPid() : -1;
}

//==========================================================================================================
// Configuration parsing
//==========================================================================================================
namespace {

std::optional<bool> parseBool(const std::string& v) {
    if (ParseFlagValue(v)) return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<uint64_t> parseUint(const std::string& v) {
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

StdioTransportOptions ParseStdioTransportConfig(const std::string& config, StdioTransportOptions base) {
    // Parse key=value pairs separated by ';' or whitespace
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        const std::string token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring option without value: {}", token);
            continue;
        }
        const std::string key = token.substr(0, eq);
        const std::string val = token.substr(eq + 1);

        bool valid = true;
        if (key == "debug" || key == "persistent" || key == "show_server_logs" || key == "strict_ids") {
            auto b = parseBool(val);
            if (!b) {
                valid = false;
            } else if (key == "debug") {
                base.debug = *b;
            } else if (key == "persistent") {
                base.mode = *b ? SessionMode::Persistent : SessionMode::Ephemeral;
            } else if (key == "show_server_logs") {
                base.showServerLogs = *b;
            } else {
                base.strictIds = *b;
            }
        } else if (key == "shutdown_timeout_ms") {
            auto ms = parseUint(val);
            if (ms) { base.shutdownTimeout = clampShutdownTimeout(*ms, "shutdown_timeout_ms"); } else { valid = false; }
        } else if (key == "client_name") {
            base.clientInfo.name = val;
        } else if (key == "client_version") {
            base.clientInfo.version = val;
        } else {
            LOG_WARN("StdioTransportFactory: unknown option '{}'", key);
            continue;
        }
        if (!valid) {
            LOG_WARN("StdioTransportFactory: invalid value '{}' for option '{}'", val, key);
        }
    }
    return base;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::vector<std::string>& command,
                                                                   const std::string& config) {
    auto options = ParseStdioTransportConfig(config, StdioTransportOptions::FromEnvironment());
    return std::make_unique<StdioTransport>(command, std::move(options));
}

} // namespace mcpexec
