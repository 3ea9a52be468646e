//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Scriptable MCP server speaking newline-delimited JSON-RPC on stdio, used by the tests
//==========================================================================================================

#include <unistd.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "mcpexec/JSONRPCTypes.h"
#include "mcpexec/Protocol.h"

using namespace mcpexec;

namespace {

// Behavior switches selected on the command line:
//   --notify=N              N notifications/message events before each reply
//   --notify-level=LEVEL    level used for --notify (default "info")
//   --progress              one notifications/progress before each reply
//   --stale                 a response with a foreign id before each reply
//   --garbage               a non-JSON line instead of the reply
//   --deep                  a deeply nested JSON array instead of the reply
//   --bad-error             a response whose error member is a string
//   --error-id-null         answer every method with an error carrying "id": null
//   --init-error            reject initialize with an RPC error
//   --eof-on=METHOD         exit without replying when METHOD arrives
//   --stderr=TEXT           write TEXT to stderr at startup
//   --fail-exit             exit with status 3 when stdin closes
//   --hang                  keep running after stdin closes
//   --log=PATH              append every received line to PATH
struct Scenario {
    int notify{0};
    std::string notifyLevel{"info"};
    bool progress{false};
    bool stale{false};
    bool garbage{false};
    bool deep{false};
    bool badError{false};
    bool errorIdNull{false};
    bool initError{false};
    std::string eofOn;
    std::string stderrText;
    bool failExit{false};
    bool hang{false};
    std::string logPath;
};

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

Scenario parseArgs(int argc, char** argv) {
    Scenario sc;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (startsWith(a, "--notify=")) sc.notify = std::atoi(a.c_str() + 9);
        else if (startsWith(a, "--notify-level=")) sc.notifyLevel = a.substr(15);
        else if (a == "--progress") sc.progress = true;
        else if (a == "--stale") sc.stale = true;
        else if (a == "--garbage") sc.garbage = true;
        else if (a == "--deep") sc.deep = true;
        else if (a == "--bad-error") sc.badError = true;
        else if (a == "--error-id-null") sc.errorIdNull = true;
        else if (a == "--init-error") sc.initError = true;
        else if (startsWith(a, "--eof-on=")) sc.eofOn = a.substr(9);
        else if (startsWith(a, "--stderr=")) sc.stderrText = a.substr(9);
        else if (a == "--fail-exit") sc.failExit = true;
        else if (a == "--hang") sc.hang = true;
        else if (startsWith(a, "--log=")) sc.logPath = a.substr(6);
    }
    return sc;
}

void emit(const std::string& line) {
    std::cout << line << '\n';
    std::cout.flush();
}

JSONValue object(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& m : members) {
        o[m.first] = std::make_shared<JSONValue>(m.second);
    }
    return JSONValue(std::move(o));
}

void emitPreamble(const Scenario& sc, int64_t id) {
    for (int i = 0; i < sc.notify; ++i) {
        JSONRPCNotification n(Methods::Log, object({{"level", JSONValue(sc.notifyLevel)},
                                                    {"data", JSONValue("message " + std::to_string(i))}}));
        emit(n.Serialize());
    }
    if (sc.progress) {
        JSONRPCNotification n("notifications/progress", object({{"progress", JSONValue(static_cast<int64_t>(50))}}));
        emit(n.Serialize());
    }
    if (sc.stale) {
        emit(JSONRPCResponse(id + 1000, object({{"stale", JSONValue(true)}})).Serialize());
    }
}

} // namespace

int main(int argc, char** argv) {
    const Scenario sc = parseArgs(argc, argv);
    if (!sc.stderrText.empty()) {
        std::cerr << sc.stderrText << std::endl;
    }

    int64_t initializeCount = 0;
    int64_t initializedCount = 0;
    int64_t requestCount = 0;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (!sc.logPath.empty()) {
            std::ofstream log(sc.logPath, std::ios::out | std::ios::app);
            log << line << '\n';
        }

        JSONRPCRequest req;
        if (!req.Deserialize(line)) {
            emit(JSONRPCResponse(std::nullopt, CreateErrorObject(JSONRPCErrorCodes::ParseError, "Parse error"), true).Serialize());
            continue;
        }
        if (req.IsNotification()) {
            if (req.method == Methods::Initialized) {
                ++initializedCount;
            }
            continue;
        }

        const int64_t id = *req.id;
        if (!sc.eofOn.empty() && req.method == sc.eofOn) {
            return 0;
        }

        if (req.method == Methods::Initialize) {
            ++initializeCount;
            if (sc.initError) {
                emit(JSONRPCResponse(id, CreateErrorObject(JSONRPCErrorCodes::InternalError, "initialize refused"), true).Serialize());
                continue;
            }
            emit(JSONRPCResponse(id, object({{"protocolVersion", JSONValue(PROTOCOL_VERSION)},
                                             {"serverInfo", object({{"name", JSONValue("mock")},
                                                                    {"version", JSONValue("1.0")}})},
                                             {"capabilities", JSONValue(JSONValue::Object{})}})).Serialize());
            continue;
        }

        ++requestCount;
        emitPreamble(sc, id);

        if (sc.garbage) {
            emit("this is not json");
            continue;
        }
        if (sc.deep) {
            emit(std::string(200000, '[') + std::string(200000, ']'));
            continue;
        }
        if (sc.badError) {
            emit("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"error\":\"oops\"}");
            continue;
        }
        if (sc.errorIdNull) {
            emit(JSONRPCResponse(std::nullopt, CreateErrorObject(-32000, "boom"), true).Serialize());
            continue;
        }

        if (req.method == "ping") {
            emit(JSONRPCResponse(id, object({{"pong", JSONValue(true)}})).Serialize());
        } else if (req.method == "echo") {
            emit(JSONRPCResponse(id, req.params.value_or(JSONValue(nullptr))).Serialize());
        } else if (req.method == "stats") {
            emit(JSONRPCResponse(id, object({{"initialize", JSONValue(initializeCount)},
                                             {"initialized", JSONValue(initializedCount)},
                                             {"requests", JSONValue(requestCount)},
                                             {"pid", JSONValue(static_cast<int64_t>(::getpid()))}})).Serialize());
        } else if (req.method == "nothing") {
            emit("{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + "}");
        } else {
            emit(JSONRPCResponse(id, CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "Method not found"), true).Serialize());
        }
    }

    if (sc.hang) {
        while (true) {
            ::pause();
        }
    }
    return sc.failExit ? 3 : 0;
}
