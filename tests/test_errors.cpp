//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the transport exception hierarchy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpexec/JSONRPCTypes.h"
#include "mcpexec/errors/Errors.h"

using namespace mcpexec;

TEST(Errors, CategoryMapping) {
    using mcpexec::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequestId), ErrorCategory::McpInvalidRequestId);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ErrorValueMappingIsLenient) {
    auto full = errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":-32602,"message":"bad","data":{"field":"x"}})"));
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->code, -32602);
    EXPECT_EQ(full->message, "bad");
    EXPECT_EQ(full->category, errors::ErrorCategory::JsonRpcInvalidParams);
    ASSERT_TRUE(full->data.has_value());
    EXPECT_EQ(*full->data, ParseJSON(R"({"field":"x"})"));

    auto empty = errors::mcpErrorFromErrorValue(ParseJSON("{}"));
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->code, 0);
    EXPECT_EQ(empty->message, "");

    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"("oops")")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":"x"})")).has_value());
}

TEST(Errors, MakeErrorValueRoundTrip) {
    errors::McpError e;
    e.code = JSONRPCErrorCodes::ResourceNotFound;
    e.message = "missing";
    auto back = errors::mcpErrorFromErrorValue(errors::makeErrorValue(e));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->code, e.code);
    EXPECT_EQ(back->category, errors::ErrorCategory::McpResourceNotFound);
}

TEST(Errors, RpcErrorCarriesCodeAndMessageVerbatim) {
    errors::McpError e;
    e.code = -32601;
    e.message = "Method not found";
    errors::RPCError err(e);
    EXPECT_STREQ(err.what(), "RPC error -32601: Method not found");
    EXPECT_EQ(err.Code(), -32601);
    EXPECT_EQ(err.Message(), "Method not found");
}

TEST(Errors, AddContextKeepsConcreteType) {
    try {
        try {
            throw errors::TransportReadError("error reading from stdout: EOF");
        } catch (errors::TransportError& e) {
            e.AddContext("init response failed");
            throw;
        }
    } catch (const errors::TransportReadError& e) {
        EXPECT_STREQ(e.what(), "init response failed: error reading from stdout: EOF");
        return;
    }
    FAIL() << "TransportReadError was not rethrown";
}

TEST(Errors, MalformedMessageKeepsRawLine) {
    errors::MalformedMessageError e("error unmarshaling message: bad", "not json");
    EXPECT_EQ(e.RawLine(), "not json");
    EXPECT_NE(std::string(e.what()).find("bad"), std::string::npos);
}

TEST(Errors, CommandExitErrorPreservesResult) {
    errors::CommandExitError e("exit status 3", "fatal: boom\n", ParseJSON(R"({"pong":true})"));
    EXPECT_STREQ(e.what(), "command error: exit status 3 (stderr: fatal: boom)");
    EXPECT_EQ(e.ExitDescription(), "exit status 3");
    EXPECT_EQ(e.CapturedStderr(), "fatal: boom\n");
    EXPECT_EQ(e.Result(), ParseJSON(R"({"pong":true})"));
}

TEST(Errors, HierarchyIsCatchableAsRuntimeError) {
    EXPECT_THROW(throw errors::SpawnError("x"), errors::TransportError);
    EXPECT_THROW(throw errors::TransportWriteError("x"), std::runtime_error);
}
