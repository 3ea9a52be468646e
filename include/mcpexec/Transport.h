//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Client transport contract shared by every way of reaching an MCP server
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpexec/JSONRPCTypes.h"

namespace mcpexec {

//==========================================================================================================
// ITransport
// Purpose: Synchronous request/response contract. One outstanding request at a time.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Execute
    // Purpose: Sends one JSON-RPC request and blocks until its result is available.
    // Args:
    //   method: JSON-RPC method name (e.g. "tools/call").
    //   params: Optional params value; omitted from the wire when empty.
    // Returns:
    //   The response "result" member (a null JSONValue when the server sent none).
    // Throws:
    //   errors::TransportError subclasses (see mcpexec/errors/Errors.h).
    //==========================================================================================================
    virtual JSONValue Execute(const std::string& method, const std::optional<JSONValue>& params) = 0;

    //==========================================================================================================
    // Close
    // Purpose: Releases any live connection or child process. Safe to call more than once.
    //==========================================================================================================
    virtual void Close() = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Factory for creating transports from a server command and a configuration string.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   command: argv of the server process (command[0] is resolved through PATH).
    //   config: Transport-specific "key=value" options separated by ';' or whitespace.
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::vector<std::string>& command,
                                                        const std::string& config) = 0;
};

} // namespace mcpexec
