//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Transport exception hierarchy and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcpexec/JSONRPCTypes.h"

namespace mcpexec {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed representation of a remote error payload.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code?, message?, data? }) to McpError.
// A missing code reads as 0 and a missing message as "". Returns std::nullopt when the
// input is not an object or code/message have the wrong type.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.IsObject()) {
        return std::nullopt;
    }
    McpError e;
    if (const JSONValue* code = errVal.Find("code")) {
        if (!std::holds_alternative<int64_t>(code->value)) {
            return std::nullopt;
        }
        e.code = static_cast<int>(std::get<int64_t>(code->value));
    }
    if (const JSONValue* msg = errVal.Find("message")) {
        if (!std::holds_alternative<std::string>(msg->value)) {
            return std::nullopt;
        }
        e.message = std::get<std::string>(msg->value);
    }
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// TransportError
// Purpose: Base of every failure raised by Execute. The message may be prefixed with context
//          (e.g. "init response failed") while the exception keeps its concrete type.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message), message_(message) {}

    const char* what() const noexcept override { return message_.c_str(); }

    void AddContext(const std::string& context) { message_ = context + ": " + message_; }

private:
    std::string message_;
};

// Empty command, pipe creation failure, or the OS refused to start the process.
class SpawnError : public TransportError {
public:
    using TransportError::TransportError;
};

// A request could not be encoded to JSON.
class SerializationError : public TransportError {
public:
    using TransportError::TransportError;
};

// End of stream or I/O failure while reading a line from the child's stdout.
class TransportReadError : public TransportError {
public:
    using TransportError::TransportError;
};

// The child's stdin rejected a write.
class TransportWriteError : public TransportError {
public:
    using TransportError::TransportError;
};

// A line was neither a JSON object nor a well-formed response.
class MalformedMessageError : public TransportError {
public:
    MalformedMessageError(const std::string& message, std::string rawLine)
        : TransportError(message), rawLine_(std::move(rawLine)) {}

    const std::string& RawLine() const { return rawLine_; }

private:
    std::string rawLine_;
};

// The peer answered with a structured JSON-RPC error.
class RPCError : public TransportError {
public:
    explicit RPCError(McpError error)
        : TransportError("RPC error " + std::to_string(error.code) + ": " + error.message),
          error_(std::move(error)) {}

    int Code() const { return error_.code; }
    const std::string& Message() const { return error_.message; }
    const McpError& Error() const { return error_; }

private:
    McpError error_;
};

//==========================================================================================================
// CommandExitError
// Purpose: Ephemeral shutdown observed a failing exit status while stderr held captured output.
//          The result obtained before shutdown is preserved.
//==========================================================================================================
class CommandExitError : public TransportError {
public:
    CommandExitError(std::string exitDescription, std::string capturedStderr, JSONValue result)
        : TransportError(buildMessage(exitDescription, capturedStderr)),
          exitDescription_(std::move(exitDescription)),
          stderr_(std::move(capturedStderr)),
          result_(std::move(result)) {}

    const std::string& ExitDescription() const { return exitDescription_; }
    const std::string& CapturedStderr() const { return stderr_; }
    const JSONValue& Result() const { return result_; }

private:
    static std::string buildMessage(const std::string& exitDescription, const std::string& capturedStderr) {
        std::string msg = "command error: " + exitDescription;
        std::string trimmed = capturedStderr;
        while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
            trimmed.pop_back();
        }
        if (!trimmed.empty()) {
            msg += " (stderr: " + trimmed + ")";
        }
        return msg;
    }

    std::string exitDescription_;
    std::string stderr_;
    JSONValue result_;
};

} // namespace errors
} // namespace mcpexec
