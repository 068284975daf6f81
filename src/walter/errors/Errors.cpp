//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: JSON-RPC error mapping, session-loss classification and user-facing messages
//==========================================================================================================

#include <cmath>
#include <limits>

#include "walter/errors/Errors.h"

namespace walter {
namespace errors {

RpcError::RpcError(std::optional<int> code, std::string serverMessage, std::optional<JSONValue> data)
    : WalterError(ErrorCategory::Rpc, "Walter RPC error: " + serverMessage),
      rpcCode(code), message(std::move(serverMessage)), errData(std::move(data)) {}

std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itMsg = obj.find("message");
    if (itMsg == obj.end() || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }

    std::optional<int> code;
    auto itCode = obj.find("code");
    if (itCode != obj.end() && itCode->second) {
        if (std::holds_alternative<int64_t>(itCode->second->value)) {
            const int64_t raw = std::get<int64_t>(itCode->second->value);
            if (raw >= std::numeric_limits<int>::min() && raw <= std::numeric_limits<int>::max()) {
                code = static_cast<int>(raw);
            }
        } else if (std::holds_alternative<double>(itCode->second->value)) {
            // Codes outside the int range or with a fractional part are left unset
            const double raw = std::get<double>(itCode->second->value);
            if (std::trunc(raw) == raw && raw >= static_cast<double>(std::numeric_limits<int>::min()) &&
                raw <= static_cast<double>(std::numeric_limits<int>::max())) {
                code = static_cast<int>(raw);
            }
        }
    }

    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }
    return RpcError(code, std::get<std::string>(itMsg->second->value), std::move(data));
}

bool isSessionLoss(const std::exception& e) {
    const auto* te = dynamic_cast<const TransportError*>(&e);
    return te != nullptr && te->httpStatus() == 404;
}

std::string toUserMessage(const std::exception& e) {
    const auto* we = dynamic_cast<const WalterError*>(&e);
    if (we == nullptr) {
        return kUnexpectedResponseMessage;
    }
    switch (we->category()) {
        case ErrorCategory::Decode:
        case ErrorCategory::Protocol:
            return kUnexpectedResponseMessage;
        default:
            return we->what();
    }
}

} // namespace errors
} // namespace walter
