//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelopes used on the Walter wire
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace walter {

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

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

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

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
};

//==========================================================================================================
// parseJSON
// Purpose: Strict parse of a complete JSON document. Trailing non-whitespace is rejected.
// Throws:
//   std::runtime_error describing the first syntax problem and its offset.
//==========================================================================================================
JSONValue parseJSON(const std::string& text);

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact serialization of a JSONValue (object key order is unspecified).
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// typeName
// Purpose: Short JSON type name for diagnostics ("object", "string", "number", ...).
//==========================================================================================================
const char* typeName(const JSONValue& value);

// JSON-RPC 2.0 ID type
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

//==========================================================================================================
// JSONRPCRequest
// Purpose: Outgoing JSON-RPC 2.0 request with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: Incoming JSON-RPC 2.0 response carrying either result or error.
// Methods:
//   Deserialize(json): Returns false when the body is not a JSON object.
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    bool Deserialize(const std::string& json);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: Outgoing JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification {
public:
    std::string jsonrpc = "2.0";
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

} // namespace walter
