//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Exception taxonomy for the Walter client and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "walter/JSONRPCTypes.h"

namespace walter {
namespace errors {

// Kind of failure; every exception thrown by the client carries exactly one.
enum class ErrorCategory {
    Transport,   // non-success HTTP status or connection failure
    Protocol,    // body is not JSON or the envelope has the wrong shape
    Rpc,         // server-reported JSON-RPC error
    Tool,        // tool result with isError == true
    Decode,      // domain payload failed validation
    Cancelled,   // caller cancellation observed
    Timeout,     // per-call or streaming deadline elapsed
    RemoteTask,  // get_response reported status "error"
    Config       // invalid client options
};

// Categorization of common JSON-RPC error codes.
enum class RpcCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Map a JSON-RPC/MCP numeric error code to an RpcCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   RpcCategory corresponding to the code, or Unknown when unmapped.
inline RpcCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return RpcCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return RpcCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return RpcCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return RpcCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return RpcCategory::JsonRpcInternal;
        default: return RpcCategory::Unknown;
    }
}

//==========================================================================================================
// WalterError
// Purpose: Base of all client exceptions. Failures are scoped to the call that raised them.
//==========================================================================================================
class WalterError : public std::runtime_error {
public:
    WalterError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), cat(category) {}

    ErrorCategory category() const noexcept { return cat; }

private:
    ErrorCategory cat;
};

//==========================================================================================================
// TransportError
// Purpose: HTTP exchange failed. httpStatus is the response status, or 0 when no response arrived.
//==========================================================================================================
class TransportError : public WalterError {
public:
    TransportError(int httpStatus, const std::string& message)
        : WalterError(ErrorCategory::Transport, message), status(httpStatus) {}

    int httpStatus() const noexcept { return status; }

private:
    int status;
};

class ProtocolError : public WalterError {
public:
    explicit ProtocolError(const std::string& message)
        : WalterError(ErrorCategory::Protocol, message) {}
};

//==========================================================================================================
// RpcError
// Purpose: Server-reported JSON-RPC error ({ message, code? }).
//==========================================================================================================
class RpcError : public WalterError {
public:
    RpcError(std::optional<int> code, std::string serverMessage, std::optional<JSONValue> data = std::nullopt);

    std::optional<int> code() const noexcept { return rpcCode; }
    RpcCategory rpcCategory() const noexcept {
        return rpcCode.has_value() ? errorCategoryFromCode(rpcCode.value()) : RpcCategory::Unknown;
    }
    const std::string& serverMessage() const noexcept { return message; }
    const std::optional<JSONValue>& data() const noexcept { return errData; }

private:
    std::optional<int> rpcCode;
    std::string message;
    std::optional<JSONValue> errData;
};

class ToolError : public WalterError {
public:
    ToolError(std::string toolName, const std::string& message)
        : WalterError(ErrorCategory::Tool, message), tool(std::move(toolName)) {}

    const std::string& toolName() const noexcept { return tool; }

private:
    std::string tool;
};

class DecodeError : public WalterError {
public:
    explicit DecodeError(const std::string& message)
        : WalterError(ErrorCategory::Decode, message) {}
};

class CancelledError : public WalterError {
public:
    CancelledError() : WalterError(ErrorCategory::Cancelled, "Request was cancelled") {}
    explicit CancelledError(const std::string& message)
        : WalterError(ErrorCategory::Cancelled, message) {}
};

class TimeoutError : public WalterError {
public:
    explicit TimeoutError(const std::string& message)
        : WalterError(ErrorCategory::Timeout, message) {}
};

class RemoteTaskError : public WalterError {
public:
    explicit RemoteTaskError(std::string remoteError)
        : WalterError(ErrorCategory::RemoteTask, "Walter error: " + remoteError), remote(std::move(remoteError)) {}

    const std::string& remoteError() const noexcept { return remote; }

private:
    std::string remote;
};

class ConfigError : public WalterError {
public:
    explicit ConfigError(const std::string& message)
        : WalterError(ErrorCategory::Config, message) {}
};

// Convert a JSON-RPC error object (shape: { message, code?, data? }) to RpcError.
// Returns std::nullopt when the input is not an object or lacks a string message.
std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal);

// Session loss is a TransportError whose status is exactly 404. Authorization failures never qualify.
bool isSessionLoss(const std::exception& e);

//==========================================================================================================
// toUserMessage
// Purpose: Text safe to show an end user. Server-reported, cancellation and timeout messages pass
//          through; decode and protocol failures are internal and get a generic message.
//==========================================================================================================
std::string toUserMessage(const std::exception& e);

// Generic message used for masked internal failures
constexpr const char* kUnexpectedResponseMessage = "Walter returned an unexpected response. Please try again.";

} // namespace errors
} // namespace walter
