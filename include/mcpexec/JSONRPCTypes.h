//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelopes exchanged with a child MCP server
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace mcpexec {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }

    // Returns the member stored under key, or nullptr when this is not an object or the key is absent.
    const JSONValue* Find(const std::string& key) const;
};

// Structural equality (objects compare by key set, arrays element-wise; int64 and double never compare equal).
bool operator==(const JSONValue& lhs, const JSONValue& rhs);
inline bool operator!=(const JSONValue& lhs, const JSONValue& rhs) { return !(lhs == rhs); }

//==========================================================================================================
// ParseJSON
// Purpose: Strictly parses one complete JSON document.
// Args:
//   text: JSON text; surrounding whitespace is allowed, trailing content is not.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Compact, single-line JSON encoding (never emits a raw newline).
// Throws:
//   errors::SerializationError when a number is NaN or infinite.
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns compact JSON for the message (no trailing newline).
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request. Without an id it is a notification and the peer must not reply.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    std::optional<int64_t> id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(std::optional<int64_t> id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(id), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsNotification() const { return !id.has_value(); }
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Fields:
//   id: Echoed request id; empty when absent or null on the wire.
//   result: Present when the member exists (a JSON null result is kept as a null value).
//   error: Present when the member exists and is not null; shape { code, message, data? }.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    std::optional<int64_t> id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(int64_t id, JSONValue result)
        : id(id), result(std::move(result)) {}
    JSONRPCResponse(std::optional<int64_t> id, JSONValue error, bool /*isError*/)
        : id(id), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    //==========================================================================================================
    // FromObject
    // Purpose: Populates this response from an already parsed message object.
    // Returns:
    //   false when id is neither an integer nor null, or error is not { code:int, message:string }.
    //==========================================================================================================
    bool FromObject(const JSONValue::Object& obj);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// IsServerNotification
// Purpose: True when a parsed line carries "method" and no "id" (absent or null).
//==========================================================================================================
bool IsServerNotification(const JSONValue::Object& message);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus MCP-specific codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // MCP specific error codes
    constexpr int InvalidRequestId = -32000;
    constexpr int MethodNotAllowed = -32001;
    constexpr int ResourceNotFound = -32002;
    constexpr int ToolNotFound = -32003;
    constexpr int PromptNotFound = -32004;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpexec
