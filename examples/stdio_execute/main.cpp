//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/stdio_execute/main.cpp
// Purpose: Runs one JSON-RPC method against a stdio MCP server and prints the result on stdout
//==========================================================================================================

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcpexec/JSONRPCTypes.h"
#include "mcpexec/StdioTransport.hpp"
#include "mcpexec/errors/Errors.h"

namespace {
void usage() {
    std::cerr << "usage: stdio_execute [--config 'key=value;...'] [--params JSON] [--log-file PATH] METHOD -- SERVER [ARGS...]\n"
              << "example: stdio_execute tools/list -- npx -y @modelcontextprotocol/server-everything\n";
}
}

int main(int argc, char** argv) {
    using namespace mcpexec;

    std::string config;
    std::optional<JSONValue> params;
    std::string method;
    std::vector<std::string> command;

    int i = 1;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--log-file" && i + 1 < argc) {
            Logger::setLogFile(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config = argv[++i];
        } else if (arg == "--params" && i + 1 < argc) {
            try {
                params = ParseJSON(argv[++i]);
            } catch (const std::runtime_error& e) {
                LOG_ERROR("invalid --params: {}", e.what());
                return 2;
            }
        } else if (method.empty()) {
            method = arg;
        } else {
            usage();
            return 2;
        }
    }
    for (; i < argc; ++i) {
        command.emplace_back(argv[i]);
    }
    if (method.empty() || command.empty()) {
        usage();
        return 2;
    }

    StdioTransportFactory factory;
    auto transport = factory.CreateTransport(command, config);
    try {
        JSONValue result = transport->Execute(method, params);
        std::cout << SerializeJSONValue(result) << std::endl;
    } catch (const errors::CommandExitError& e) {
        // The server answered before failing; keep its answer
        std::cout << SerializeJSONValue(e.Result()) << std::endl;
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const errors::TransportError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
    transport->Close();
    return 0;
}
